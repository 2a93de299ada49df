#include <stylebind/loader/load_cache.h>
#include <vector>

namespace stylebind::loader {

std::optional<LoadResult> LoadCache::get(const core::FileIdentity& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file);
    if (it == entries_.end() || it->second.state != EntryState::Resolved) {
        return std::nullopt;
    }
    return it->second.result.get();
}

EntryState LoadCache::state(const core::FileIdentity& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file);
    return it == entries_.end() ? EntryState::Unrequested : it->second.state;
}

LoadCache::Claim LoadCache::begin_load(const core::FileIdentity& file,
                                       const std::optional<core::FileIdentity>& requester) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(file);
    if (it == entries_.end()) {
        Entry entry;
        entry.promise = std::make_shared<std::promise<LoadResult>>();
        entry.result = entry.promise->get_future().share();
        Claim claim{Claim::Kind::Owner, entry.result};
        entries_.emplace(file, std::move(entry));
        if (requester) waits_for_[*requester].insert(file);
        return claim;
    }

    if (it->second.state == EntryState::InFlight && requester) {
        if (*requester == file || reaches(file, *requester)) {
            return Claim{Claim::Kind::Cycle, {}};
        }
        waits_for_[*requester].insert(file);
    }
    return Claim{Claim::Kind::Waiter, it->second.result};
}

void LoadCache::complete(const core::FileIdentity& file, LoadResult result) {
    std::shared_ptr<std::promise<LoadResult>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(file);
        if (it == entries_.end() || it->second.state != EntryState::InFlight) return;
        it->second.state = EntryState::Resolved;
        promise = std::move(it->second.promise);
        drop_edges_from(file);
    }
    // Waiters wake up outside the lock.
    promise->set_value(std::move(result));
}

void LoadCache::fail(const core::FileIdentity& file, std::exception_ptr error) {
    std::shared_ptr<std::promise<LoadResult>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(file);
        if (it == entries_.end() || it->second.state != EntryState::InFlight) return;
        it->second.state = EntryState::Failed;
        promise = std::move(it->second.promise);
        drop_edges_from(file);
    }
    promise->set_exception(std::move(error));
}

void LoadCache::discard_failed() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.state == EntryState::Failed) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

bool LoadCache::evict(const core::FileIdentity& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file);
    if (it == entries_.end() || it->second.state == EntryState::InFlight) return false;
    entries_.erase(it);
    return true;
}

void LoadCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.state == EntryState::InFlight) {
            ++it;
        } else {
            it = entries_.erase(it);
        }
    }
}

size_t LoadCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// Depth-first search over the wait-for graph. Caller holds mutex_.
bool LoadCache::reaches(const core::FileIdentity& from, const core::FileIdentity& to) const {
    std::vector<core::FileIdentity> stack{from};
    std::set<core::FileIdentity> visited;
    while (!stack.empty()) {
        core::FileIdentity current = std::move(stack.back());
        stack.pop_back();
        if (current == to) return true;
        if (!visited.insert(current).second) continue;
        auto edges = waits_for_.find(current);
        if (edges == waits_for_.end()) continue;
        for (const auto& next : edges->second) {
            if (!visited.count(next)) stack.push_back(next);
        }
    }
    return false;
}

void LoadCache::drop_edges_from(const core::FileIdentity& file) {
    waits_for_.erase(file);
}

} // namespace stylebind::loader
