#include <superbox/bridge/session.hpp>

#include <superbox/core/log.hpp>
#include <superbox/process/child_process.hpp>

#include <algorithm>
#include <cctype>

namespace superbox {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:         return "Idle";
        case SessionState::Provisioning: return "Provisioning";
        case SessionState::Handshaking:  return "Handshaking";
        case SessionState::Ready:        return "Ready";
        case SessionState::Relaying:     return "Relaying";
        case SessionState::Terminating:  return "Terminating";
        case SessionState::Closed:       return "Closed";
    }
    return "Closed";
}

namespace {

bool IsTruthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes";
}

} // anonymous namespace

ConnectionParams ConnectionParams::FromQuery(
    const std::multimap<std::string, std::string>& query, const ConnectionParams& defaults) {
    ConnectionParams params;
    params.entrypoint = defaults.entrypoint;
    params.language = defaults.language;
    for (const auto& [key, value] : query) {
        if (key == "name") {
            params.name = value;
        } else if (key == "test_mode") {
            params.test_mode = IsTruthy(value);
        } else if (key == "repo_url") {
            params.repo_url = value;
        } else if (key == "entrypoint" && !value.empty()) {
            params.entrypoint = value;
        } else if (key == "lang" && !value.empty()) {
            params.language = value;
        }
    }
    return params;
}

// ---------------------------------------------------------------------------
// ProcessInterrupt
// ---------------------------------------------------------------------------

void ProcessInterrupt::Arm(pid_t group) {
    std::lock_guard<std::mutex> guard(mutex_);
    group_ = group;
    if (fired_ && group_ > 0) {
        LogDebug("bridge", "Interrupted before start, killing group " + std::to_string(group_));
        KillProcessGroup(group_);
    }
}

void ProcessInterrupt::Disarm() {
    std::lock_guard<std::mutex> guard(mutex_);
    group_ = 0;
}

bool ProcessInterrupt::Fire() {
    std::lock_guard<std::mutex> guard(mutex_);
    fired_ = true;
    if (group_ <= 0) {
        return false;
    }
    KillProcessGroup(group_);
    return true;
}

bool ProcessInterrupt::Consume() {
    std::lock_guard<std::mutex> guard(mutex_);
    bool fired = fired_;
    fired_ = false;
    return fired;
}

} // namespace superbox
