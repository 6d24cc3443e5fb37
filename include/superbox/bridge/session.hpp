#pragma once

#include <superbox/process/server_supervisor.hpp>
#include <superbox/provision/i_workspace_provisioner.hpp>
#include <superbox/registry/descriptor.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace superbox {

// Idle -> Provisioning -> Handshaking -> Ready -> Relaying -> Terminating -> Closed
enum class SessionState {
    Idle,
    Provisioning,
    Handshaking,
    Ready,
    Relaying,
    Terminating,
    Closed,
};

const char* SessionStateName(SessionState state);

// ---------------------------------------------------------------------------
// ConnectionParams: query parameters of a connection or single-shot call.
// ---------------------------------------------------------------------------
struct ConnectionParams {
    std::string name;
    bool test_mode = false;
    std::string repo_url;              // test mode: repository to run directly
    std::string entrypoint = "main.py";
    std::string language = "python";

    // From decoded query parameters; unknown keys are ignored. "test_mode" is
    // true for "true", "1" or "yes". `defaults` supplies the entrypoint and
    // language when the query leaves them out.
    static ConnectionParams FromQuery(const std::multimap<std::string, std::string>& query,
                                      const ConnectionParams& defaults);
    static ConnectionParams FromQuery(const std::multimap<std::string, std::string>& query);

    // Test mode with a repository URL supplies its own descriptor.
    [[nodiscard]] bool HasDirectDescriptor() const noexcept {
        return test_mode && !repo_url.empty();
    }
};

// Defined out of class: the default argument needs the member initializers,
// which are not usable until ConnectionParams is complete.
inline ConnectionParams ConnectionParams::FromQuery(
    const std::multimap<std::string, std::string>& query) {
    return FromQuery(query, ConnectionParams{});
}

// ---------------------------------------------------------------------------
// ProcessInterrupt: kills a session's server from outside the session lock.
//
// The bridge arms it with the child's process group after spawn and disarms
// it before reaping. Fire() kills an armed group at once; fired before the
// spawn, the next Arm() kills instead. Either way a read blocked on the
// child ends with ProcessExited.
// ---------------------------------------------------------------------------
class ProcessInterrupt {
public:
    ProcessInterrupt() = default;

    ProcessInterrupt(const ProcessInterrupt&) = delete;
    ProcessInterrupt& operator=(const ProcessInterrupt&) = delete;

    void Arm(pid_t group);
    void Disarm();

    // Returns true when a live group was signalled.
    bool Fire();

    // True once after Fire(); the failure that follows is the interrupt's.
    bool Consume();

private:
    std::mutex mutex_;
    pid_t group_ = 0;
    bool fired_ = false;
};

// ---------------------------------------------------------------------------
// Session: everything one connection owns. Guarded by its registry slot.
// ---------------------------------------------------------------------------
struct Session {
    std::string id;
    std::optional<ConnectionParams> params; // nullopt: no connect seen
    SessionState state = SessionState::Idle;
    std::optional<std::string> server_name;
    std::optional<Descriptor> descriptor;
    std::optional<Workspace> workspace;
    std::unique_ptr<ServerSupervisor> supervisor;
    // Shared with the registry; the pointer itself never changes.
    const std::shared_ptr<ProcessInterrupt> interrupt = std::make_shared<ProcessInterrupt>();
};

} // namespace superbox
