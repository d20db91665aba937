#pragma once

#include "core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace muxcache {

/**
 * Download progress: bytes received so far, total bytes expected (0 if unknown)
 */
using ProgressCallback = std::function<void(int64_t received, int64_t total)>;

/**
 * Transport that fetches a remote resource into a temporary file
 *
 * Implementations call the completion exactly once, possibly on another
 * thread, with the path of a temporary file that the caller takes over.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * Start a download
     * @param url Remote URL
     * @param progress Optional progress callback
     * @param completion Receives the temporary file path or the transport error
     *        (ConnectivityError for transient failures, DownloadError otherwise)
     */
    virtual void download(const std::string& url,
                          ProgressCallback progress,
                          Completion<std::filesystem::path> completion) = 0;
};

} // namespace muxcache
