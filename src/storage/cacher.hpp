#pragma once

#include <memory>
#include <optional>
#include <string>

namespace muxcache {

/**
 * Persistent store for cached values
 *
 * Values are opaque byte strings addressed by (domain, key). The domain is a
 * logical collection name (a directory, a table); the key identifies the
 * entity within it. An empty domain addresses the store's root collection.
 *
 * Implementations must tolerate concurrent calls for different keys.
 * Read failures are reported as misses.
 */
class Cacher {
public:
    virtual ~Cacher() = default;

    virtual std::optional<std::string> load(const std::string& key, const std::string& domain) = 0;

    /**
     * @throws StorageError if the value could not be written
     */
    virtual void save(const std::string& bytes, const std::string& key, const std::string& domain) = 0;

    virtual void delete_one(const std::string& key, const std::string& domain) = 0;

    virtual void delete_domain(const std::string& domain) = 0;
};

/**
 * Memory-only caching: always misses, ignores writes
 */
class NoCacher : public Cacher {
public:
    std::optional<std::string> load(const std::string&, const std::string&) override {
        return std::nullopt;
    }
    void save(const std::string&, const std::string&, const std::string&) override {}
    void delete_one(const std::string&, const std::string&) override {}
    void delete_domain(const std::string&) override {}
};

} // namespace muxcache
