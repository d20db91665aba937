#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace muxcache {

/**
 * OS-standard cache directory for muxcache data
 *
 * Linux: $XDG_CACHE_HOME/mux or ~/.cache/mux
 * macOS: ~/Library/Caches/Mux
 * Windows: %LOCALAPPDATA%\Mux\Cache
 */
std::filesystem::path default_cache_dir();

/**
 * Percent-encode a key so that it is safe to use as a single file name.
 * Characters outside [A-Za-z0-9._-] are encoded, as is a leading dot.
 * @throws std::invalid_argument if key is empty
 */
std::string encode_key(const std::string& key);

/**
 * SHA-256 of the input, URL-safe base64 encoded ('/' and '+' become '_',
 * padding removed), keeping the last max_chars characters
 */
std::string url_safe_hash(const std::string& input, size_t max_chars);

/**
 * File name for a cache key: the percent-encoded key, or '~' followed by its
 * URL-safe hash when the encoded form is longer than kMaxEncodedKeyLength
 */
std::string key_file_name(const std::string& key, const std::string& extension);

constexpr size_t kMaxEncodedKeyLength = 128;

} // namespace muxcache
