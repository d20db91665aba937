#pragma once

#include "storage/cacher.hpp"
#include <filesystem>
#include <string>

namespace muxcache {

/**
 * File-based persistent store
 *
 * Layout: <root>/<domain>/<encoded key>.json, one file per entity.
 * - Keys are percent-encoded, or hashed when too long (see key_file_name)
 * - Writes go to a temporary file that is renamed into place, so readers
 *   never observe a partially written file
 * - Read errors are misses; the directory is created on first write
 */
class JsonDiskCacher : public Cacher {
public:
    /**
     * Constructor
     * @param root_dir Root directory (default: default_cache_dir())
     */
    explicit JsonDiskCacher(const std::filesystem::path& root_dir = {});

    std::optional<std::string> load(const std::string& key, const std::string& domain) override;
    void save(const std::string& bytes, const std::string& key, const std::string& domain) override;
    void delete_one(const std::string& key, const std::string& domain) override;

    /**
     * Remove a whole domain directory
     * @throws std::invalid_argument if domain is empty (would wipe the root)
     */
    void delete_domain(const std::string& domain) override;

    const std::filesystem::path& root_dir() const { return root_dir_; }

    /**
     * Path a (key, domain) pair is stored under
     */
    std::filesystem::path file_path(const std::string& key, const std::string& domain) const;

private:
    std::filesystem::path root_dir_;

    std::filesystem::path domain_dir(const std::string& domain) const;
};

} // namespace muxcache
