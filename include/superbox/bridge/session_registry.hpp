#pragma once

#include <superbox/bridge/session.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace superbox {

class SessionRegistry;

// One registry entry. The slot mutex is held for the whole of a message or a
// disconnect; `closed` is set before the slot leaves the map.
struct SessionSlot {
    std::mutex mutex;
    Session session;
    bool closed = false;
};

// ---------------------------------------------------------------------------
// LockedSession: exclusive access to one live session. Unlocks on
// destruction.
// ---------------------------------------------------------------------------
class LockedSession {
public:
    LockedSession(SessionRegistry& registry, std::shared_ptr<SessionSlot> slot,
                  std::unique_lock<std::mutex> lock);

    LockedSession(LockedSession&&) = default;
    LockedSession(const LockedSession&) = delete;
    LockedSession& operator=(const LockedSession&) = delete;

    Session& operator*() { return slot_->session; }
    Session* operator->() { return &slot_->session; }

    // Mark the slot closed and drop it from the registry. Waiters on this
    // slot will re-acquire a fresh one.
    void Close();

private:
    SessionRegistry* registry_;
    std::shared_ptr<SessionSlot> slot_;
    std::unique_lock<std::mutex> lock_;
};

// ---------------------------------------------------------------------------
// SessionRegistry: connection id -> session slot, plus the parameters each
// connection was opened with.
//
// The map mutex is only held for lookup/insert/erase; callers block on the
// slot mutex, never on the map. Parameters outlive failed and disconnected
// sessions so the next message on the id cold-starts again; a later connect
// replaces them.
// ---------------------------------------------------------------------------
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Lock the session for `id`. With `create`, a missing slot is created
    // (Idle, carrying the stored parameters); otherwise nullopt.
    [[nodiscard]] std::optional<LockedSession> Lock(const std::string& id, bool create);

    void SetParams(const std::string& id, const ConnectionParams& params);
    [[nodiscard]] std::optional<ConnectionParams> Params(const std::string& id) const;

    // Fire the interrupt of `id`'s session without waiting for its slot.
    // False when there is no session.
    bool Interrupt(const std::string& id);

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] std::vector<std::string> Ids() const;

private:
    friend class LockedSession;

    // Erase `id` only if it still maps to `slot`.
    void Erase(const std::string& id, const SessionSlot* slot);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionSlot>> slots_;
    std::map<std::string, ConnectionParams> params_;
};

} // namespace superbox
