#include "storage/paths.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace muxcache {

std::filesystem::path default_cache_dir() {
#ifdef _WIN32
    const char* local = getenv("LOCALAPPDATA");
    if (local) {
        return std::filesystem::path(local) / "Mux" / "Cache";
    }
    return "C:\\Temp\\Mux\\Cache";
#elif __APPLE__
    const char* home = getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / "Library" / "Caches" / "Mux";
    }
    return "/tmp/Mux/Cache";
#else
    const char* xdg = getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "mux";
    }
    const char* home = getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "mux";
    }
    return "/tmp/mux/cache";
#endif
}

std::string encode_key(const std::string& key) {
    if (key.empty()) {
        throw std::invalid_argument("Cache key must not be empty");
    }

    std::ostringstream oss;
    for (size_t i = 0; i < key.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(key[i]);
        bool safe = std::isalnum(c) || c == '-' || c == '_' || (c == '.' && i > 0);
        if (safe) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string url_safe_hash(const std::string& input, size_t max_chars) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    // 4 output chars per 3 input bytes, plus terminator
    std::vector<unsigned char> encoded(4 * ((digest_len + 2) / 3) + 1);
    int encoded_len = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digest_len));

    std::string result(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(encoded_len));
    std::replace(result.begin(), result.end(), '/', '_');
    std::replace(result.begin(), result.end(), '+', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    if (result.size() > max_chars) {
        result = result.substr(result.size() - max_chars);
    }
    return result;
}

std::string key_file_name(const std::string& key, const std::string& extension) {
    std::string name = encode_key(key);
    if (name.size() > kMaxEncodedKeyLength) {
        // '~' never survives encode_key, so hashed names cannot collide with encoded ones
        name = "~" + url_safe_hash(key, 43);
    }
    if (!extension.empty()) {
        name += "." + extension;
    }
    return name;
}

} // namespace muxcache
