#pragma once

#include "loader/downloader.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace muxcache {

/**
 * Downloader backed by libcurl
 *
 * Features:
 * - Streams the response body straight to a temporary file
 * - Configurable timeout (default 30s)
 * - Maps transport failures onto the error taxonomy: connection, DNS,
 *   timeout and send/receive errors are ConnectivityError; HTTP status
 *   >= 400 and any other curl error are DownloadError
 *
 * Each transfer runs on its own detached thread with its own curl handle.
 * The completion is invoked on that thread. The destructor waits for
 * outstanding transfers; a completion may drop the last reference to its
 * downloader, in which case the destructor skips the calling transfer.
 */
class CurlFileDownloader : public Downloader {
public:
    /**
     * Constructor
     * @param timeout_ms Per-transfer timeout in milliseconds (default: 30000)
     * @param temp_dir Directory for partial downloads (default: system temp directory)
     */
    explicit CurlFileDownloader(long timeout_ms = 30000, const std::filesystem::path& temp_dir = {});

    ~CurlFileDownloader() override;

    CurlFileDownloader(const CurlFileDownloader&) = delete;
    CurlFileDownloader& operator=(const CurlFileDownloader&) = delete;

    void download(const std::string& url,
                  ProgressCallback progress,
                  Completion<std::filesystem::path> completion) override;

    /**
     * Block until every transfer started so far has completed. Called from a
     * completion, waits for every transfer except the caller's own.
     */
    void wait_all();

    long timeout_ms() const;

private:
    // Shared with the transfer threads, which may outlive the downloader
    struct Shared {
        long timeout_ms;
        std::filesystem::path temp_dir;
        std::atomic<unsigned long> counter{0};

        std::mutex mutex;
        std::condition_variable idle;
        size_t active = 0;
    };

    static void run(const std::shared_ptr<Shared>& shared,
                    const std::string& url,
                    ProgressCallback progress,
                    Completion<std::filesystem::path> completion);
    static std::filesystem::path transfer(Shared& shared, const std::string& url,
                                          const ProgressCallback& progress);
    static std::filesystem::path next_temp_path(Shared& shared);

    std::shared_ptr<Shared> shared_;
};

} // namespace muxcache
