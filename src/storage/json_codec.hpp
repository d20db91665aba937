#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace muxcache {

/**
 * Serialize a value for the persistent store.
 * T needs nlohmann::json to_json/from_json support.
 * @throws nlohmann::json::exception if the value cannot be serialized
 */
template <typename T>
std::string encode_value(const T& value) {
    return nlohmann::json(value).dump();
}

/**
 * Deserialize a stored value; malformed or incompatible data is a miss
 */
template <typename T>
std::optional<T> decode_value(const std::string& bytes) {
    try {
        return nlohmann::json::parse(bytes).get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace muxcache
