#pragma once
#include <stylebind/loader/types.h>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

namespace stylebind::loader {

enum class EntryState { Unrequested, InFlight, Resolved, Failed };

// Memoizes loads for one run (or one regeneration epoch). All state sits
// behind one mutex; claiming an identity is a single locked step, so no two
// callers can both start loading the same file.
//
// The cache also keeps a wait-for graph: an edge A -> B means the load of A
// is blocked on B. A claim that would close a loop in that graph is refused
// with Claim::Kind::Cycle instead of waiting forever.
class LoadCache {
public:
    struct Claim {
        enum class Kind {
            Owner,   // caller must finish with complete() or fail()
            Waiter,  // `result` is shared with the owner
            Cycle,   // waiting would deadlock
        };
        Kind kind = Kind::Owner;
        std::shared_future<LoadResult> result;
    };

    // Resolved results only.
    std::optional<LoadResult> get(const core::FileIdentity& file) const;
    EntryState state(const core::FileIdentity& file) const;

    // `requester` is the in-flight file that will block on `file`, or
    // nullopt for a top-level request.
    Claim begin_load(const core::FileIdentity& file,
                     const std::optional<core::FileIdentity>& requester);

    void complete(const core::FileIdentity& file, LoadResult result);
    void fail(const core::FileIdentity& file, std::exception_ptr error);

    // Drops Failed entries so the next top-level request retries them.
    // Callers already holding the failed future keep their failure.
    void discard_failed();
    // Forgets a Resolved or Failed entry. In-flight entries stay.
    bool evict(const core::FileIdentity& file);
    void clear();
    size_t size() const;

private:
    struct Entry {
        EntryState state = EntryState::InFlight;
        std::shared_ptr<std::promise<LoadResult>> promise;
        std::shared_future<LoadResult> result;
    };

    bool reaches(const core::FileIdentity& from, const core::FileIdentity& to) const;
    void drop_edges_from(const core::FileIdentity& file);

    mutable std::mutex mutex_;
    std::unordered_map<core::FileIdentity, Entry> entries_;
    std::map<core::FileIdentity, std::set<core::FileIdentity>> waits_for_;
};

} // namespace stylebind::loader
