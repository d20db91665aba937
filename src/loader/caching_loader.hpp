/**
 * @file caching_loader.hpp
 * @brief Download-deduplicating blob cache with disk persistence
 *
 * A CachingLoader maps URLs to decoded objects. The blob behind each URL is
 * downloaded at most once: concurrent requests share the transfer, and the
 * file stays on disk until it is explicitly cleared. Decoded objects are kept
 * in a bounded LRU memory cache.
 *
 * There is no expiry: objects behind a URL are assumed to be immutable.
 */

#pragma once

#include "cache/lru_cache.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "loader/blob_store.hpp"
#include "loader/downloader.hpp"
#include "loader/file_downloader.hpp"
#include "mux/repository.hpp"
#include "util/logger.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace muxcache {

constexpr size_t kDefaultMemoryCacheCapacity = 50;

/**
 * @brief Blob loader configuration
 */
struct LoaderConfig {
    std::string cache_id;                     ///< Registry ID and blob subdirectory
    size_t memory_capacity;                   ///< Max decoded objects kept in memory
    std::filesystem::path root_dir;           ///< Blob root (empty: default_cache_dir())
    std::shared_ptr<Downloader> downloader;   ///< Transport (null: CurlFileDownloader)

    explicit LoaderConfig(std::string id = "")
        : cache_id(std::move(id)),
          memory_capacity(kDefaultMemoryCacheCapacity) {}
};

/**
 * True for "file://" URLs and plain filesystem paths
 */
inline bool is_local_locator(const std::string& url) {
    return url.rfind("file://", 0) == 0 || url.find("://") == std::string::npos;
}

/**
 * Filesystem path of a local locator
 */
inline std::filesystem::path local_path(const std::string& url) {
    if (url.rfind("file://", 0) == 0) {
        std::string path = url.substr(7);
        if (path.rfind("localhost/", 0) == 0) {
            path.erase(0, 9);
        }
        return path;
    }
    return url;
}

/**
 * Caching downloader for objects derived from a file, e.g. images decoded
 * from a downloaded file, or the file path itself for streamed media
 *
 * The transform turns a blob file into the object kept in memory. Returning
 * std::nullopt marks the file as damaged: it is deleted and the waiters fail
 * with TransformError.
 *
 * Must be owned by a std::shared_ptr; pending downloads keep the loader alive.
 *
 * Example usage:
 *   LoaderConfig config("Images");
 *   auto images = std::make_shared<CachingLoader<Image>>(config, decode_image);
 *   images->request("https://example.com/a.png", [](const Result<Image>& r) { ... });
 */
template <typename T>
class CachingLoader : public RepositoryMember,
                      public std::enable_shared_from_this<CachingLoader<T>> {
public:
    using Transform = std::function<std::optional<T>(const std::filesystem::path&)>;

    /**
     * Constructor
     * @param config Cache ID, memory capacity, blob root, transport
     * @param transform Converts a blob file into the in-memory object
     * @throws std::invalid_argument if cache_id is empty, capacity is zero or transform is null
     */
    CachingLoader(LoaderConfig config, Transform transform)
        : cache_id_(checked_cache_id(std::move(config.cache_id)))
        , transform_(std::move(transform))
        , downloader_(config.downloader ? std::move(config.downloader)
                                        : std::make_shared<CurlFileDownloader>())
        , store_(config.root_dir, cache_id_)
        , memory_(config.memory_capacity)
    {
        if (!transform_) {
            throw std::invalid_argument("CachingLoader: transform cannot be null");
        }
    }

    void request(const std::string& url, Completion<T> completion) {
        request(url, nullptr, std::move(completion));
    }

    /**
     * Retrieve the object for a URL, downloading the blob on first use
     * @param url Remote URL, "file://" URL or local path
     * @param progress Optional download progress callback
     * @param completion Receives the result exactly once; may be empty to
     *        prefetch the blob without decoding it
     */
    void request(const std::string& url, ProgressCallback progress, Completion<T> completion) {
        std::optional<T> hit;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hit = memory_.touch(url);
        }
        if (hit) {
            if (completion) {
                completion(Result<T>::success(std::move(*hit)));
            }
            return;
        }

        if (is_local_locator(url)) {
            if (completion) {
                completion(load_local(url));
            }
            return;
        }

        bool start_fetch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& waiters = pending_[url];
            waiters.push_back(std::move(completion));
            start_fetch = waiters.size() == 1;
        }
        if (start_fetch) {
            fetch(url, std::move(progress));
        }
    }

    /**
     * True if the next request() for this URL would download
     */
    bool will_refresh(const std::string& url) const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (memory_.has(url)) {
                return false;
            }
        }
        if (is_local_locator(url)) {
            return false;
        }
        return !store_.exists(store_.path_for(url));
    }

    /**
     * Drop the decoded objects kept in memory
     */
    CachingLoader& clear_memory() override {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_.remove_all();
        return *this;
    }

    /**
     * Delete the downloaded blobs
     */
    CachingLoader& clear_cache() {
        store_.remove_all();
        return *this;
    }

    CachingLoader& clear() override {
        clear_cache();
        return clear_memory();
    }

    // Blobs are written when they arrive
    CachingLoader& flush() override { return *this; }

    const std::string& cache_id() const override { return cache_id_; }

    std::filesystem::path blob_path(const std::string& url) const { return store_.path_for(url); }

    CacheStats memory_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return memory_.get_stats();
    }

private:
    static std::string checked_cache_id(std::string cache_id) {
        if (cache_id.empty()) {
            throw std::invalid_argument("CachingLoader: cache_id must not be empty");
        }
        return cache_id;
    }

    std::optional<T> run_transform(const std::filesystem::path& path, std::string& failure) const {
        try {
            auto value = transform_(path);
            if (!value) {
                failure = "Failed to load " + path.string();
            }
            return value;
        } catch (const std::exception& e) {
            failure = "Failed to load " + path.string() + ": " + e.what();
            return std::nullopt;
        }
    }

    Result<T> load_local(const std::string& url) {
        std::string failure;
        auto value = run_transform(local_path(url), failure);
        if (!value) {
            return Result<T>::failure(TransformError(failure));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        memory_.set(url, *value);
        return Result<T>::success(std::move(*value));
    }

    void fetch(const std::string& url, ProgressCallback progress) {
        std::filesystem::path dest = store_.path_for(url);
        CacheContext ctx(cache_id_, url);

        if (store_.exists(dest)) {
            Logger::get_instance().log_download(ctx, "blob_found", dest.filename().string());
            fetch_completed(url, Result<std::filesystem::path>::success(dest));
            return;
        }

        Logger::get_instance().log_download(ctx, "download_started", dest.filename().string());
        auto self = this->shared_from_this();
        try {
            downloader_->download(url, std::move(progress),
                [self, url, dest](const Result<std::filesystem::path>& downloaded) {
                    if (!downloaded.ok()) {
                        self->fetch_completed(url, downloaded);
                        return;
                    }
                    try {
                        self->store_.adopt(downloaded.value(), dest);
                    } catch (const StorageError&) {
                        self->fetch_completed(url, Result<std::filesystem::path>::failure(std::current_exception()));
                        return;
                    }
                    self->fetch_completed(url, Result<std::filesystem::path>::success(dest));
                });
        } catch (const std::exception&) {
            // The transfer never started; fail the waiters so the URL is not left pending
            fetch_completed(url, Result<std::filesystem::path>::failure(std::current_exception()));
        }
    }

    void fetch_completed(const std::string& url, const Result<std::filesystem::path>& result) {
        if (!result.ok()) {
            Logger::get_instance().log_fetch_failed(CacheContext(cache_id_, url), result.error_message());
            complete(url, Result<T>::failure(result.error()));
            return;
        }

        // Prefetch only: leave the blob on disk without decoding it
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(url);
            bool wanted = false;
            if (it != pending_.end()) {
                for (const auto& waiter : it->second) {
                    if (waiter) {
                        wanted = true;
                        break;
                    }
                }
            }
            if (!wanted) {
                pending_.erase(url);
                return;
            }
        }

        const std::filesystem::path& path = result.value();
        std::string failure;
        auto value = run_transform(path, failure);
        if (value) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                memory_.set(url, *value);
            }
            complete(url, Result<T>::success(std::move(*value)));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            memory_.remove(url);
        }
        store_.remove(path);
        Logger::get_instance().log_storage_error(CacheContext(cache_id_, url), failure);
        complete(url, Result<T>::failure(TransformError(failure)));
    }

    void complete(const std::string& url, const Result<T>& result) {
        std::vector<Completion<T>> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(url);
            if (it == pending_.end()) {
                return;
            }
            waiters.swap(it->second);
            pending_.erase(it);
        }
        for (auto& waiter : waiters) {
            if (waiter) {
                waiter(result);
            }
        }
    }

    std::string cache_id_;
    Transform transform_;
    std::shared_ptr<Downloader> downloader_;
    BlobStore store_;

    mutable std::mutex mutex_;
    LRUCache<std::string, T> memory_;
    std::map<std::string, std::vector<Completion<T>>> pending_;
};

/**
 * Loader for large media that is streamed from disk: the object is the
 * blob's local path
 */
inline std::shared_ptr<CachingLoader<std::filesystem::path>> make_media_loader(
    LoaderConfig config = LoaderConfig("Media")) {
    return std::make_shared<CachingLoader<std::filesystem::path>>(
        std::move(config),
        [](const std::filesystem::path& path) -> std::optional<std::filesystem::path> { return path; });
}

} // namespace muxcache
