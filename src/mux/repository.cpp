#include "mux/repository.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <stdexcept>

namespace muxcache {

MuxRepository& MuxRepository::main() {
    static MuxRepository instance;
    return instance;
}

void MuxRepository::register_member(std::shared_ptr<RepositoryMember> member) {
    if (!member) {
        throw std::invalid_argument("MuxRepository: member cannot be null");
    }

    const std::string id = member->cache_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (members_.find(id) != members_.end()) {
            throw RegistryError("MuxRepository: duplicate registration (ID: " + id + ")");
        }
        members_[id] = std::move(member);
    }

    Logger::get_instance().log_registry_event("registered", id);
}

void MuxRepository::unregister(const std::string& cache_id) {
    size_t removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = members_.erase(cache_id);
    }
    if (removed > 0) {
        Logger::get_instance().log_registry_event("unregistered", cache_id);
    }
}

std::vector<std::shared_ptr<RepositoryMember>> MuxRepository::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<RepositoryMember>> result;
    result.reserve(members_.size());
    for (const auto& [id, member] : members_) {
        result.push_back(member);
    }
    return result;
}

void MuxRepository::flush_all() {
    auto members = snapshot();
    Logger::get_instance().info("Flushing registered caches", {{"count", std::to_string(members.size())}});
    for (auto& member : members) {
        member->flush();
    }
}

void MuxRepository::clear_all() {
    for (auto& member : snapshot()) {
        member->clear();
    }
}

void MuxRepository::clear_memory_all() {
    for (auto& member : snapshot()) {
        member->clear_memory();
    }
}

bool MuxRepository::contains(const std::string& cache_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.find(cache_id) != members_.end();
}

size_t MuxRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

void MuxRepository::reset() {
    std::map<std::string, std::shared_ptr<RepositoryMember>> released;
    std::lock_guard<std::mutex> lock(mutex_);
    released.swap(members_);
}

} // namespace muxcache
