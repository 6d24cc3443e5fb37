#pragma once

#include <superbox/bridge/message.hpp>
#include <superbox/bridge/session_registry.hpp>
#include <superbox/core/deadline.hpp>
#include <superbox/core/result.hpp>
#include <superbox/process/server_supervisor.hpp>
#include <superbox/provision/i_workspace_provisioner.hpp>
#include <superbox/registry/i_descriptor_resolver.hpp>
#include <superbox/transport/i_connection_sink.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace superbox {

struct BridgeOptions {
    SupervisorOptions supervisor;
    std::chrono::milliseconds single_shot_timeout{30000};
};

// ---------------------------------------------------------------------------
// ProtocolBridge: drives sessions through
//   Idle -> Provisioning -> Handshaking -> Ready -> Relaying -> Closed
// for persistent connections, and runs single-shot calls end to end.
//
// Thread-safe: calls for different connection ids run in parallel, calls for
// the same id are serialized on its session slot.
// ---------------------------------------------------------------------------
class ProtocolBridge {
public:
    ProtocolBridge(IDescriptorResolver& resolver, IWorkspaceProvisioner& provisioner,
                   BridgeOptions options = {});
    ~ProtocolBridge();

    ProtocolBridge(const ProtocolBridge&) = delete;
    ProtocolBridge& operator=(const ProtocolBridge&) = delete;

    // Register connection `id` in Idle. No process work happens here.
    // InvalidRequest without a usable name (test mode with repo_url excepted).
    [[nodiscard]] Result<void, Error> Connect(const std::string& id,
                                              const ConnectionParams& params);

    // Relay one client message, cold-starting the session if needed. The
    // response line, or the error envelope on failure, is posted to `sink`.
    // On failure the session is torn down; its parameters are kept.
    [[nodiscard]] Result<void, Error> HandleMessage(const std::string& id,
                                                    std::string_view body,
                                                    IConnectionSink& sink);

    // Kill, remove the workspace, close the session. A relay in progress on
    // `id` is interrupted rather than waited out. The connection parameters
    // stay, so a later message cold-starts a fresh session. Unknown ids are a
    // no-op.
    void Disconnect(const std::string& id);

    // Whole lifecycle for one message under a single wall-clock deadline.
    // Returns the child's response; the workspace is gone on every path.
    [[nodiscard]] Result<std::string, Error> HandleSingleShot(const ConnectionParams& params,
                                                              std::string_view body);

    [[nodiscard]] size_t ActiveSessions() const { return registry_.Size(); }

    // Disconnect every session.
    void Shutdown();

private:
    // Name and descriptor for a cold start; in-band name wins over params.
    [[nodiscard]] Result<Descriptor, Error> ResolveDescriptor(
        const ConnectionParams& params, const std::optional<std::string>& mcp_name,
        std::string& server_name);

    // Provisioning + Handshaking. Leaves the session Ready.
    [[nodiscard]] Result<void, Error> ColdStart(Session& session,
                                                const std::optional<std::string>& mcp_name);

    [[nodiscard]] Result<void, Error> Relay(Session& session, const InboundMessage& inbound,
                                            IConnectionSink& sink);

    // Kill the child and remove the workspace. Leaves the session Idle.
    static void Teardown(Session& session);

    IDescriptorResolver& resolver_;
    IWorkspaceProvisioner& provisioner_;
    BridgeOptions options_;
    SessionRegistry registry_;
};

// InvalidRequest unless `params` name a server or carry a test-mode repo_url.
[[nodiscard]] Result<void, Error> ValidateConnectionParams(const ConnectionParams& params);

} // namespace superbox
