#include <superbox/bridge/protocol_bridge.hpp>

#include <superbox/core/log.hpp>
#include <superbox/core/types.hpp>

namespace superbox {

namespace {

constexpr const char* kTestModeName = "test";

Error MakeBridgeError(ErrorKind kind, const std::string& message) {
    return Error::Make(kind, "Bridge", message);
}

// Removes a workspace when the single-shot call leaves scope.
class WorkspaceGuard {
public:
    WorkspaceGuard() = default;
    ~WorkspaceGuard() {
        if (workspace_.has_value()) {
            RemoveWorkspace(*workspace_);
        }
    }

    WorkspaceGuard(const WorkspaceGuard&) = delete;
    WorkspaceGuard& operator=(const WorkspaceGuard&) = delete;

    void Adopt(Workspace workspace) { workspace_ = std::move(workspace); }
    [[nodiscard]] const Workspace& Get() const { return *workspace_; }

private:
    std::optional<Workspace> workspace_;
};

void LogInstallFailure(const std::optional<Error>& failure) {
    if (failure.has_value()) {
        LogWarn("bridge", "Dependency install failed, continuing: " + failure->ToString());
        if (failure->detail.has_value()) {
            LogDebug("bridge", "pip stderr: " + Truncate(*failure->detail, 200));
        }
    }
}

} // anonymous namespace

Result<void, Error> ValidateConnectionParams(const ConnectionParams& params) {
    if (params.HasDirectDescriptor()) {
        return Result<void, Error>::Ok();
    }
    if (params.name.empty()) {
        return Result<void, Error>::Err(MakeBridgeError(
            ErrorKind::InvalidRequest, "Missing 'name' parameter"));
    }
    auto name = ServerName::Create(params.name);
    if (name.IsErr()) {
        return Result<void, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest, name.Error()));
    }
    return Result<void, Error>::Ok();
}

ProtocolBridge::ProtocolBridge(IDescriptorResolver& resolver,
                               IWorkspaceProvisioner& provisioner,
                               BridgeOptions options)
    : resolver_(resolver), provisioner_(provisioner), options_(std::move(options)) {}

ProtocolBridge::~ProtocolBridge() {
    Shutdown();
}

// ---------------------------------------------------------------------------
// Persistent sessions
// ---------------------------------------------------------------------------

Result<void, Error> ProtocolBridge::Connect(const std::string& id,
                                            const ConnectionParams& params) {
    LogContext context(id);
    auto valid = ValidateConnectionParams(params);
    if (valid.IsErr()) {
        return valid;
    }

    auto session = registry_.Lock(id, /*create=*/true);
    if ((*session)->supervisor || (*session)->workspace.has_value()) {
        LogInfo("bridge", "Connection " + id + " reconnected, dropping its old session");
        Teardown(**session);
    }
    (*session)->params = params;
    (*session)->state = SessionState::Idle;
    registry_.SetParams(id, params);

    LogInfo("bridge", "Connection " + id + " registered" +
                          (params.name.empty() ? std::string{} : " for " + params.name));
    return Result<void, Error>::Ok();
}

Result<void, Error> ProtocolBridge::HandleMessage(const std::string& id,
                                                  std::string_view body,
                                                  IConnectionSink& sink) {
    LogContext context(id);
    auto inbound = PrepareInbound(body);
    auto session = registry_.Lock(id, /*create=*/true);

    auto result = Relay(**session, inbound, sink);
    if (result.IsErr()) {
        const auto& error = result.Error();
        if ((*session)->interrupt->Consume()) {
            // The client disconnected mid-relay; nobody is waiting for an answer.
            LogInfo("bridge", "Connection " + id + " interrupted by disconnect: " +
                                  error.ToString());
        } else {
            LogError("bridge", "Connection " + id + ": " + error.ToString());
            auto posted = sink.Post(error.ToEnvelope());
            if (posted.IsErr()) {
                LogDebug("bridge", "Error envelope not delivered: " + posted.Error().ToString());
            }
        }
        (*session)->state = SessionState::Terminating;
        Teardown(**session);
        session->Close();
    }
    return result;
}

void ProtocolBridge::Disconnect(const std::string& id) {
    LogContext context(id);
    // Kill first: a relay holding the slot may be blocked on the child.
    const bool known = registry_.Interrupt(id);
    auto session = registry_.Lock(id, /*create=*/false);
    if (!session.has_value()) {
        if (known) {
            LogInfo("bridge", "Connection " + id + " closed by its interrupted relay");
        } else {
            LogDebug("bridge", "Disconnect for unknown connection " + id);
        }
        return;
    }
    (*session)->state = SessionState::Terminating;
    Teardown(**session);
    session->Close();
    LogInfo("bridge", "Connection " + id + " closed");
}

void ProtocolBridge::Shutdown() {
    for (const auto& id : registry_.Ids()) {
        Disconnect(id);
    }
}

Result<void, Error> ProtocolBridge::Relay(Session& session, const InboundMessage& inbound,
                                          IConnectionSink& sink) {
    if (session.state == SessionState::Ready && !session.supervisor->IsAlive()) {
        LogWarn("bridge", "Server for " + session.id + " died, restarting");
        Teardown(session);
    }

    if (session.state == SessionState::Idle) {
        auto started = ColdStart(session, inbound.mcp_name);
        if (started.IsErr()) {
            return started;
        }
    }

    session.state = SessionState::Relaying;
    LogDebug("bridge", "-> " + Truncate(inbound.line, 200));
    auto sent = session.supervisor->Send(inbound.line);
    if (sent.IsErr()) {
        return sent;
    }

    // Notifications and client responses get no reply line.
    if (inbound.is_json && !inbound.is_request) {
        session.state = SessionState::Ready;
        return Result<void, Error>::Ok();
    }

    auto line = session.supervisor->ReceiveLine();
    if (line.IsErr()) {
        return Result<void, Error>::Err(std::move(line).Error());
    }
    auto response = StripFraming(line.Value());
    LogDebug("bridge", "<- " + Truncate(response, 200));

    auto posted = sink.Post(response);
    if (posted.IsErr()) {
        return posted;
    }
    session.state = SessionState::Ready;
    return Result<void, Error>::Ok();
}

Result<void, Error> ProtocolBridge::ColdStart(Session& session,
                                              const std::optional<std::string>& mcp_name) {
    if (!session.params.has_value() && !mcp_name.has_value()) {
        return Result<void, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest,
            "MCP name not provided in message or connection params"));
    }
    const auto params = session.params.value_or(ConnectionParams{});

    session.state = SessionState::Provisioning;
    std::string name;
    auto descriptor = ResolveDescriptor(params, mcp_name, name);
    if (descriptor.IsErr()) {
        return Result<void, Error>::Err(std::move(descriptor).Error());
    }
    session.server_name = name;
    session.descriptor = descriptor.Value();
    LogInfo("bridge", "Starting " + name + " for connection " + session.id);

    auto server_name = ServerName::Create(name);
    if (server_name.IsErr()) {
        return Result<void, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest,
                                                        server_name.Error()));
    }
    auto workspace = provisioner_.Materialize(session.descriptor->repository_url,
                                              server_name.Value(), Deadline::Never());
    if (workspace.IsErr()) {
        return Result<void, Error>::Err(std::move(workspace).Error());
    }
    session.workspace = std::move(workspace).Value();
    LogInstallFailure(provisioner_.InstallDependencies(*session.workspace, Deadline::Never()));

    session.state = SessionState::Handshaking;
    session.supervisor = std::make_unique<ServerSupervisor>(options_.supervisor);
    auto spawned = session.supervisor->Spawn(session.workspace->path,
                                             session.descriptor->entrypoint,
                                             session.descriptor->language);
    if (spawned.IsErr()) {
        return spawned;
    }
    auto pid = session.supervisor->Pid();
    if (pid.has_value()) {
        session.interrupt->Arm(*pid);
    }
    auto greeted = session.supervisor->Handshake();
    if (greeted.IsErr()) {
        return greeted;
    }

    session.state = SessionState::Ready;
    LogInfo("bridge", "Session " + session.id + " ready");
    return Result<void, Error>::Ok();
}

Result<Descriptor, Error> ProtocolBridge::ResolveDescriptor(
    const ConnectionParams& params, const std::optional<std::string>& mcp_name,
    std::string& server_name) {
    server_name = mcp_name.value_or(params.name);

    if (params.HasDirectDescriptor()) {
        if (server_name.empty()) {
            server_name = kTestModeName;
        }
        LogInfo("bridge", "Test mode: using repository " + params.repo_url);
        Descriptor descriptor{params.repo_url, params.entrypoint, params.language};
        auto valid = ValidateDescriptor(descriptor);
        if (valid.IsErr()) {
            return Result<Descriptor, Error>::Err(std::move(valid).Error());
        }
        return Result<Descriptor, Error>::Ok(std::move(descriptor));
    }

    if (server_name.empty()) {
        return Result<Descriptor, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest,
            "MCP name not provided in message or connection params"));
    }
    auto name = ServerName::Create(server_name);
    if (name.IsErr()) {
        return Result<Descriptor, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest,
                                                              name.Error()));
    }
    return resolver_.Resolve(name.Value());
}

void ProtocolBridge::Teardown(Session& session) {
    session.interrupt->Disarm();
    if (session.supervisor) {
        session.supervisor->Kill();
        session.supervisor.reset();
    }
    if (session.workspace.has_value()) {
        RemoveWorkspace(*session.workspace);
        session.workspace.reset();
    }
    session.descriptor.reset();
    session.server_name.reset();
    session.state = SessionState::Idle;
}

// ---------------------------------------------------------------------------
// Single-shot
// ---------------------------------------------------------------------------

Result<std::string, Error> ProtocolBridge::HandleSingleShot(const ConnectionParams& params,
                                                            std::string_view body) {
    LogContext context("single-shot");
    auto valid = ValidateConnectionParams(params);
    if (valid.IsErr()) {
        return Result<std::string, Error>::Err(std::move(valid).Error());
    }

    const auto deadline = Deadline::After(options_.single_shot_timeout);
    auto inbound = PrepareInbound(body);

    std::string name;
    auto descriptor = ResolveDescriptor(params, std::nullopt, name);
    if (descriptor.IsErr()) {
        return Result<std::string, Error>::Err(std::move(descriptor).Error());
    }
    auto server_name = ServerName::Create(name);
    if (server_name.IsErr()) {
        return Result<std::string, Error>::Err(MakeBridgeError(ErrorKind::InvalidRequest,
                                                               server_name.Error()));
    }
    LogInfo("bridge", "Request received: " + name);

    WorkspaceGuard workspace;
    auto materialized = provisioner_.Materialize(descriptor.Value().repository_url,
                                                 server_name.Value(), deadline);
    if (materialized.IsErr()) {
        return Result<std::string, Error>::Err(std::move(materialized).Error());
    }
    workspace.Adopt(std::move(materialized).Value());
    LogInstallFailure(provisioner_.InstallDependencies(workspace.Get(), deadline));

    auto supervisor_options = options_.supervisor;
    supervisor_options.capture_stderr_on_exit = true;
    ServerSupervisor supervisor(supervisor_options);

    const auto timeout_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(options_.single_shot_timeout).count();
    auto fail = [&supervisor, timeout_seconds](Error error) {
        supervisor.Kill();
        if (error.kind == ErrorKind::Timeout) {
            error.message = "MCP server execution timed out after " +
                            std::to_string(timeout_seconds) + " seconds";
        }
        return Result<std::string, Error>::Err(std::move(error));
    };

    if (deadline.Expired()) {
        return fail(MakeBridgeError(ErrorKind::Timeout, "Deadline passed during provisioning"));
    }
    auto spawned = supervisor.Spawn(workspace.Get().path, descriptor.Value().entrypoint,
                                    descriptor.Value().language);
    if (spawned.IsErr()) {
        return fail(std::move(spawned).Error());
    }
    auto greeted = supervisor.Handshake(deadline);
    if (greeted.IsErr()) {
        return fail(std::move(greeted).Error());
    }
    auto sent = supervisor.Send(inbound.line);
    if (sent.IsErr()) {
        return fail(std::move(sent).Error());
    }

    Result<std::string, Error> response = inbound.is_request
        ? supervisor.ReceiveLine(deadline)
        : supervisor.DrainOutput(deadline);
    if (response.IsErr()) {
        return fail(std::move(response).Error());
    }

    supervisor.Kill();
    if (inbound.is_request) {
        return Result<std::string, Error>::Ok(StripFraming(response.Value()));
    }
    return response;
}

} // namespace superbox
