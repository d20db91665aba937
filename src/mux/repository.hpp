#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace muxcache {

/**
 * Lifecycle interface implemented by every cache that can be registered
 * with a MuxRepository
 */
class RepositoryMember {
public:
    virtual ~RepositoryMember() = default;

    /// Write dirty memory-cached values to the persistent store
    virtual RepositoryMember& flush() = 0;

    /// Free memory-cached values; the next request refetches
    virtual RepositoryMember& clear_memory() = 0;

    /// Discard memory and persistent caches
    virtual RepositoryMember& clear() = 0;

    /// Stable identifier, unique within a repository
    virtual const std::string& cache_id() const = 0;
};

/**
 * Table of cache instances for bulk flush/clear operations
 *
 * Typical uses: clear_all() when the user signs out, flush_all() before the
 * process exits or is suspended, clear_memory_all() under memory pressure.
 *
 * The repository holds strong references. Non-singleton caches must be
 * unregistered before they are released or they stay alive indefinitely.
 *
 * Usage Example:
 *   @code
 *   auto profiles = std::make_shared<MultiplexerMap<std::string, Profile>>("profiles", fetch_profile);
 *   MuxRepository::main().register_member(profiles);
 *   ...
 *   MuxRepository::main().flush_all();
 *   @endcode
 */
class MuxRepository {
public:
    MuxRepository() = default;

    MuxRepository(const MuxRepository&) = delete;
    MuxRepository& operator=(const MuxRepository&) = delete;

    /**
     * Process-wide repository
     */
    static MuxRepository& main();

    /**
     * Add a cache
     * @throws RegistryError if another cache is registered under the same ID
     * @throws std::invalid_argument if member is null
     */
    void register_member(std::shared_ptr<RepositoryMember> member);

    /**
     * Remove a cache; unknown IDs are ignored
     */
    void unregister(const std::string& cache_id);

    void flush_all();
    void clear_all();
    void clear_memory_all();

    bool contains(const std::string& cache_id) const;
    size_t size() const;

    /**
     * Drop every registration (process teardown, tests)
     */
    void reset();

private:
    std::vector<std::shared_ptr<RepositoryMember>> snapshot() const;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<RepositoryMember>> members_;
};

} // namespace muxcache
