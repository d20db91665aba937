#pragma once

#include <string>
#include <type_traits>

namespace muxcache {

/**
 * Lossless string form of a cache key.
 *
 * Used both for logging and as the persistent store key. Provide an overload
 * in the key type's namespace for custom key types.
 */
inline std::string to_key_string(const std::string& key) {
    return key;
}

inline std::string to_key_string(const char* key) {
    return key ? std::string(key) : std::string();
}

template <typename K, typename = std::enable_if_t<std::is_integral<K>::value>>
std::string to_key_string(K key) {
    return std::to_string(key);
}

} // namespace muxcache
