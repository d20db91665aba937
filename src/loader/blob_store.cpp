#include "loader/blob_store.hpp"
#include "core/errors.hpp"
#include "storage/paths.hpp"
#include "util/logger.hpp"
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace muxcache {

namespace {

constexpr size_t kBlobHashLength = 32;

} // namespace

std::string url_path_extension(const std::string& url) {
    std::string path = url;

    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }

    // Skip "scheme://authority"
    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t path_start = path.find('/', scheme + 3);
        path = path_start == std::string::npos ? std::string() : path.substr(path_start);
    }

    size_t slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);

    size_t dot = last.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == last.size()) {
        return "";
    }

    std::string ext = last.substr(dot + 1);
    for (unsigned char c : ext) {
        if (!std::isalnum(c)) {
            return "";
        }
    }
    return "." + ext;
}

BlobStore::BlobStore(const fs::path& root_dir, const std::string& cache_id)
    : cache_id_(cache_id)
    , directory_((root_dir.empty() ? default_cache_dir() : root_dir) / encode_key(cache_id))
{
}

fs::path BlobStore::path_for(const std::string& url) const {
    return directory_ / (url_safe_hash(url, kBlobHashLength) + url_path_extension(url));
}

bool BlobStore::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

void BlobStore::adopt(const fs::path& temp_path, const fs::path& dest) const {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw StorageError("Failed to create blob directory " + dest.parent_path().string() + ": " + ec.message());
    }

    fs::rename(temp_path, dest, ec);
    if (!ec) {
        return;
    }

    // rename() fails across filesystems; fall back to copy + remove
    std::error_code copy_ec;
    fs::copy_file(temp_path, dest, fs::copy_options::overwrite_existing, copy_ec);
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    if (copy_ec) {
        throw StorageError("Failed to move " + temp_path.string() + " to " + dest.string() + ": " + copy_ec.message());
    }
}

void BlobStore::remove(const fs::path& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::get_instance().log_storage_error(CacheContext(cache_id_, path.filename().string()), ec.message());
    }
}

void BlobStore::remove_all() const {
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        Logger::get_instance().log_storage_error(CacheContext(cache_id_, ""), ec.message());
    }
}

} // namespace muxcache
