#include "loader/file_downloader.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <curl/curl.h>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace muxcache {

namespace {

// CURL write callback: append the chunk to the temp file
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* file = static_cast<std::ofstream*>(userp);
    file->write(static_cast<const char*>(contents), static_cast<std::streamsize>(total_size));
    return *file ? total_size : 0;
}

// CURL progress callback; a throwing callback aborts the transfer
int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* progress = static_cast<const ProgressCallback*>(clientp);
    try {
        (*progress)(static_cast<int64_t>(dlnow), static_cast<int64_t>(dltotal));
    } catch (const std::exception& e) {
        Logger::get_instance().warn("Progress callback threw; aborting transfer", {{"error", e.what()}});
        return 1;
    } catch (...) {
        Logger::get_instance().warn("Progress callback threw; aborting transfer");
        return 1;
    }
    return 0;
}

// Set on transfer threads to the state of the downloader that owns them
thread_local const void* current_transfer_owner = nullptr;

bool is_connectivity_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

// Owns one easy handle for the duration of a transfer
struct EasyHandle {
    CURL* curl;

    EasyHandle() : curl(curl_easy_init()) {
        if (!curl) {
            throw DownloadError("Failed to initialize CURL");
        }
    }

    ~EasyHandle() {
        curl_easy_cleanup(curl);
    }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

} // namespace

CurlFileDownloader::CurlFileDownloader(long timeout_ms, const fs::path& temp_dir)
    : shared_(std::make_shared<Shared>())
{
    shared_->timeout_ms = timeout_ms;
    shared_->temp_dir = temp_dir.empty() ? fs::temp_directory_path() : temp_dir;
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlFileDownloader::~CurlFileDownloader() {
    wait_all();
    curl_global_cleanup();
}

long CurlFileDownloader::timeout_ms() const {
    return shared_->timeout_ms;
}

void CurlFileDownloader::download(const std::string& url,
                                  ProgressCallback progress,
                                  Completion<fs::path> completion) {
    std::shared_ptr<Shared> shared = shared_;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        ++shared->active;
    }

    try {
        std::thread([shared, url, progress = std::move(progress), completion = std::move(completion)]() mutable {
            current_transfer_owner = shared.get();
            run(shared, url, std::move(progress), std::move(completion));
            current_transfer_owner = nullptr;

            std::lock_guard<std::mutex> lock(shared->mutex);
            --shared->active;
            shared->idle.notify_all();
        }).detach();
    } catch (...) {
        std::lock_guard<std::mutex> lock(shared->mutex);
        --shared->active;
        shared->idle.notify_all();
        throw;
    }
}

void CurlFileDownloader::run(const std::shared_ptr<Shared>& shared,
                             const std::string& url,
                             ProgressCallback progress,
                             Completion<fs::path> completion) {
    Result<fs::path> result = Result<fs::path>::failure(DownloadError("Download did not run"));
    try {
        result = Result<fs::path>::success(transfer(*shared, url, progress));
    } catch (...) {
        result = Result<fs::path>::failure(std::current_exception());
    }

    if (!completion) {
        return;
    }
    try {
        completion(result);
    } catch (const std::exception& e) {
        Logger::get_instance().error("Download completion threw",
            {{"url", url}, {"error", e.what()}});
    }
}

void CurlFileDownloader::wait_all() {
    size_t own = current_transfer_owner == shared_.get() ? 1 : 0;
    std::unique_lock<std::mutex> lock(shared_->mutex);
    shared_->idle.wait(lock, [this, own] { return shared_->active <= own; });
}

fs::path CurlFileDownloader::next_temp_path(Shared& shared) {
    std::ostringstream oss;
    oss << "mux-download-"
        << std::chrono::steady_clock::now().time_since_epoch().count()
        << "-" << shared.counter.fetch_add(1) << ".part";
    return shared.temp_dir / oss.str();
}

fs::path CurlFileDownloader::transfer(Shared& shared, const std::string& url, const ProgressCallback& progress) {
    fs::path temp_path = next_temp_path(shared);
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw DownloadError("Failed to open " + temp_path.string() + " for writing");
    }

    EasyHandle handle;
    curl_easy_setopt(handle.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.curl, CURLOPT_TIMEOUT_MS, shared.timeout_ms);
    curl_easy_setopt(handle.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.curl, CURLOPT_WRITEDATA, &file);

    if (progress) {
        curl_easy_setopt(handle.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle.curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(handle.curl, CURLOPT_XFERINFODATA, &progress);
    }

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(handle.curl);
    file.close();

    long status_code = 0;
    curl_easy_getinfo(handle.curl, CURLINFO_RESPONSE_CODE, &status_code);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (res != CURLE_OK || status_code >= 400) {
        std::error_code ec;
        fs::remove(temp_path, ec);

        if (res != CURLE_OK) {
            std::string error_msg = "CURL error: ";
            error_msg += curl_easy_strerror(res);
            error_msg += " (" + url + ")";
            if (is_connectivity_code(res)) {
                throw ConnectivityError(error_msg);
            }
            throw DownloadError(error_msg, static_cast<int>(status_code));
        }

        std::ostringstream oss;
        oss << "HTTP " << status_code << " (" << url << ")";
        throw DownloadError(oss.str(), static_cast<int>(status_code));
    }

    if (!file) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        throw DownloadError("Failed to write " + temp_path.string());
    }

    Logger::get_instance().debug("Download finished",
        {{"url", url}, {"status", std::to_string(status_code)},
         {"duration_ms", std::to_string(duration.count())}});
    return temp_path;
}

} // namespace muxcache
