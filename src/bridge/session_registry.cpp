#include <superbox/bridge/session_registry.hpp>

#include <superbox/core/log.hpp>

namespace superbox {

LockedSession::LockedSession(SessionRegistry& registry, std::shared_ptr<SessionSlot> slot,
                             std::unique_lock<std::mutex> lock)
    : registry_(&registry), slot_(std::move(slot)), lock_(std::move(lock)) {}

void LockedSession::Close() {
    if (slot_->closed) {
        return;
    }
    slot_->closed = true;
    slot_->session.state = SessionState::Closed;
    registry_->Erase(slot_->session.id, slot_.get());
}

std::optional<LockedSession> SessionRegistry::Lock(const std::string& id, bool create) {
    for (;;) {
        std::shared_ptr<SessionSlot> slot;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            auto it = slots_.find(id);
            if (it != slots_.end()) {
                slot = it->second;
            } else if (create) {
                slot = std::make_shared<SessionSlot>();
                slot->session.id = id;
                auto params = params_.find(id);
                if (params != params_.end()) {
                    slot->session.params = params->second;
                }
                slots_.emplace(id, slot);
                LogDebug("registry", "Session " + id + " created");
            } else {
                return std::nullopt;
            }
        }

        std::unique_lock<std::mutex> lock(slot->mutex);
        if (!slot->closed) {
            return LockedSession(*this, std::move(slot), std::move(lock));
        }
        // Closed while we waited; look again.
    }
}

void SessionRegistry::SetParams(const std::string& id, const ConnectionParams& params) {
    std::lock_guard<std::mutex> guard(mutex_);
    params_[id] = params;
}

std::optional<ConnectionParams> SessionRegistry::Params(const std::string& id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = params_.find(id);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::Interrupt(const std::string& id) {
    std::shared_ptr<ProcessInterrupt> interrupt;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            return false;
        }
        interrupt = it->second->session.interrupt;
    }
    if (interrupt->Fire()) {
        LogDebug("registry", "Session " + id + " interrupted");
    }
    return true;
}

size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return slots_.size();
}

std::vector<std::string> SessionRegistry::Ids() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        ids.push_back(id);
    }
    return ids;
}

void SessionRegistry::Erase(const std::string& id, const SessionSlot* slot) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = slots_.find(id);
    if (it != slots_.end() && it->second.get() == slot) {
        slots_.erase(it);
        LogDebug("registry", "Session " + id + " removed");
    }
}

} // namespace superbox
