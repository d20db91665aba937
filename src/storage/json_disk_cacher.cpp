#include "storage/json_disk_cacher.hpp"
#include "core/errors.hpp"
#include "storage/paths.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace muxcache {

namespace {

const char* const kExtension = "json";

std::atomic<unsigned long> temp_counter{0};

std::string temp_suffix() {
    std::ostringstream oss;
    oss << ".tmp-" << std::hash<std::thread::id>()(std::this_thread::get_id())
        << "-" << temp_counter.fetch_add(1);
    return oss.str();
}

} // namespace

JsonDiskCacher::JsonDiskCacher(const fs::path& root_dir)
    : root_dir_(root_dir.empty() ? default_cache_dir() : root_dir)
{
}

fs::path JsonDiskCacher::domain_dir(const std::string& domain) const {
    if (domain.empty()) {
        return root_dir_;
    }
    return root_dir_ / encode_key(domain);
}

fs::path JsonDiskCacher::file_path(const std::string& key, const std::string& domain) const {
    return domain_dir(domain) / key_file_name(key, kExtension);
}

std::optional<std::string> JsonDiskCacher::load(const std::string& key, const std::string& domain) {
    auto path = file_path(key, domain);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return bytes;
}

void JsonDiskCacher::save(const std::string& bytes, const std::string& key, const std::string& domain) {
    auto path = file_path(key, domain);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("Failed to create cache directory " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path temp_path = path;
    temp_path += temp_suffix();

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("Failed to open " + temp_path.string() + " for writing");
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(temp_path, ec);
            throw StorageError("Failed to write " + temp_path.string());
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StorageError("Failed to move " + temp_path.string() + " into place: " + ec.message());
    }
}

void JsonDiskCacher::delete_one(const std::string& key, const std::string& domain) {
    std::error_code ec;
    fs::remove(file_path(key, domain), ec);
    if (ec) {
        Logger::get_instance().log_storage_error(CacheContext(domain, key), ec.message());
    }
}

void JsonDiskCacher::delete_domain(const std::string& domain) {
    if (domain.empty()) {
        throw std::invalid_argument("JsonDiskCacher: refusing to delete the root domain");
    }
    std::error_code ec;
    fs::remove_all(domain_dir(domain), ec);
    if (ec) {
        Logger::get_instance().log_storage_error(CacheContext(domain, ""), ec.message());
    }
}

} // namespace muxcache
