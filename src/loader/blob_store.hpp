#pragma once

#include <filesystem>
#include <string>

namespace muxcache {

/**
 * Directory of downloaded blobs for one loader
 *
 * Layout: <root>/<encoded cache ID>/<hash><.ext>, where <hash> is the last
 * 32 characters of the URL-safe SHA-256 of the URL and <.ext> is the
 * extension of the URL path, if any.
 */
class BlobStore {
public:
    /**
     * Constructor
     * @param root_dir Root directory (default: default_cache_dir())
     * @param cache_id Loader identifier, used as the subdirectory name
     */
    BlobStore(const std::filesystem::path& root_dir, const std::string& cache_id);

    /**
     * Blob path for a URL; does not touch the filesystem
     */
    std::filesystem::path path_for(const std::string& url) const;

    bool exists(const std::filesystem::path& path) const;

    /**
     * Move a downloaded temporary file into the store
     * @throws StorageError if the file cannot be moved or copied into place
     */
    void adopt(const std::filesystem::path& temp_path, const std::filesystem::path& dest) const;

    /**
     * Delete one blob; errors are logged
     */
    void remove(const std::filesystem::path& path) const;

    /**
     * Delete the whole blob directory; errors are logged
     */
    void remove_all() const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::string cache_id_;
    std::filesystem::path directory_;
};

/**
 * Extension of a URL's path including the leading dot, or an empty string.
 * Query and fragment are ignored; only alphanumeric extensions are kept.
 */
std::string url_path_extension(const std::string& url);

} // namespace muxcache
