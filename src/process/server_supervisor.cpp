#include <superbox/process/server_supervisor.hpp>

#include <superbox/core/log.hpp>
#include <superbox/core/types.hpp>
#include <superbox/core/version.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <system_error>

namespace superbox {

namespace {

namespace fs = std::filesystem;

Error MakeSupervisorError(ErrorKind kind, const std::string& message) {
    return Error::Make(kind, "Supervisor", message);
}

// Resolve <workspace>/<entrypoint>, refusing anything that leaves the
// workspace.
std::optional<fs::path> ResolveEntrypoint(const fs::path& workspace,
                                          const std::string& entrypoint) {
    fs::path relative{entrypoint};
    if (entrypoint.empty() || relative.is_absolute()) {
        return std::nullopt;
    }
    std::error_code ec;
    auto root = fs::weakly_canonical(workspace, ec);
    if (ec) return std::nullopt;
    auto target = fs::weakly_canonical(root / relative, ec);
    if (ec) return std::nullopt;

    auto root_str = root.string();
    auto target_str = target.string();
    if (target_str.size() <= root_str.size() ||
        target_str.compare(0, root_str.size(), root_str) != 0 ||
        target_str[root_str.size()] != '/') {
        return std::nullopt;
    }
    if (!fs::is_regular_file(target, ec)) {
        return std::nullopt;
    }
    return target;
}

} // anonymous namespace

std::string BuildPythonPath(const fs::path& workspace,
                            const std::optional<std::string>& dependency_dir,
                            const char* inherited) {
    std::string path;
    if (dependency_dir.has_value() && !dependency_dir->empty()) {
        path = *dependency_dir + ":";
    }
    path += workspace.string();
    if (inherited != nullptr && *inherited != '\0') {
        path += ":";
        path += inherited;
    }
    return path;
}

ServerSupervisor::ServerSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {
    if (options_.client_version.empty()) {
        options_.client_version = kVersion;
    }
}

ServerSupervisor::~ServerSupervisor() {
    Kill();
}

std::string ServerSupervisor::InitializeRequest() const {
    nlohmann::ordered_json request;
    request["jsonrpc"] = "2.0";
    request["id"] = 0;
    request["method"] = "initialize";
    request["params"]["protocolVersion"] = options_.protocol_version;
    request["params"]["capabilities"] = nlohmann::ordered_json::object();
    request["params"]["clientInfo"]["name"] = options_.client_name;
    request["params"]["clientInfo"]["version"] = options_.client_version;
    return request.dump();
}

std::string ServerSupervisor::InitializedNotification() {
    return R"({"jsonrpc":"2.0","method":"notifications/initialized"})";
}

Result<void, Error> ServerSupervisor::Spawn(const fs::path& workspace,
                                            const std::string& entrypoint,
                                            const std::string& language) {
    if (process_.has_value()) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::Internal, "A server process is already running"));
    }
    if (!IsSupportedLanguage(language)) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::UnsupportedLanguage,
            "Unsupported language: " + language + ". Only python is supported"));
    }

    auto entrypoint_path = ResolveEntrypoint(workspace, entrypoint);
    if (!entrypoint_path.has_value()) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::EntrypointMissing, "Entrypoint not found: " + entrypoint));
    }

    std::error_code ec;
    std::optional<std::string> deps;
    if (!options_.dependency_dir.empty() && fs::is_directory(options_.dependency_dir, ec)) {
        deps = options_.dependency_dir;
    }

    SpawnOptions spawn;
    spawn.argv = {options_.python_executable, entrypoint_path->string()};
    spawn.working_directory = workspace.string();
    spawn.environment["PYTHONPATH"] =
        BuildPythonPath(workspace, deps, std::getenv("PYTHONPATH"));
    spawn.environment["PYTHONUNBUFFERED"] = "1";

    auto child = ChildProcess::Spawn(spawn);
    if (child.IsErr()) {
        return Result<void, Error>::Err(std::move(child).Error());
    }

    ServerProcess process;
    process.child = std::move(child).Value();
    process.workspace = workspace;
    process.started_at = std::chrono::system_clock::now();
    LogInfo("supervisor", "Started " + entrypoint + " (pid " +
                              std::to_string(process.child->Pid()) + ")");
    process_ = std::move(process);
    return Result<void, Error>::Ok();
}

Result<void, Error> ServerSupervisor::Handshake(const Deadline& deadline) {
    if (!process_.has_value()) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::HandshakeFailure, "No server process to initialize"));
    }
    if (process_->ready) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::Internal, "Server process is already initialized"));
    }

    auto& child = *process_->child;
    auto sent = child.Write(InitializeRequest() + "\n");
    if (sent.IsErr()) {
        return Result<void, Error>::Err(ExitError(
            ErrorKind::HandshakeFailure, "Handshake", "Server rejected initialize", deadline));
    }

    auto response = child.ReadLine(deadline);
    if (response.IsErr()) {
        if (response.Error().kind == ErrorKind::Timeout) {
            return Result<void, Error>::Err(std::move(response).Error());
        }
        return Result<void, Error>::Err(ExitError(
            ErrorKind::HandshakeFailure, "Handshake",
            "Server closed its output before answering initialize", deadline));
    }
    LogDebug("supervisor", "Init response: " + Truncate(response.Value(), 200));

    sent = child.Write(InitializedNotification() + "\n");
    if (sent.IsErr()) {
        return Result<void, Error>::Err(ExitError(
            ErrorKind::HandshakeFailure, "Handshake",
            "Server exited before the initialized notification", deadline));
    }

    process_->ready = true;
    LogInfo("supervisor", "Server initialized");
    return Result<void, Error>::Ok();
}

Result<void, Error> ServerSupervisor::Send(std::string_view message) {
    if (!process_.has_value()) {
        return Result<void, Error>::Err(MakeSupervisorError(
            ErrorKind::BrokenPipe, "No server process"));
    }
    std::string line(message);
    line.push_back('\n');
    auto sent = process_->child->Write(line);
    if (sent.IsErr()) {
        auto error = std::move(sent).Error();
        error.operation = "Send";
        if (auto status = process_->child->Status()) {
            error.message += " (server " + status->Describe() + ")";
        }
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ServerSupervisor::ReceiveLine(const Deadline& deadline) {
    if (!process_.has_value()) {
        return Result<std::string, Error>::Err(MakeSupervisorError(
            ErrorKind::ProcessExited, "No server process"));
    }
    auto line = process_->child->ReadLine(deadline);
    if (line.IsErr() && line.Error().kind == ErrorKind::ProcessExited) {
        return Result<std::string, Error>::Err(ExitError(
            ErrorKind::ProcessExited, "Receive", "Server closed its output", deadline));
    }
    return line;
}

Result<std::string, Error> ServerSupervisor::DrainOutput(const Deadline& deadline) {
    if (!process_.has_value()) {
        return Result<std::string, Error>::Err(MakeSupervisorError(
            ErrorKind::ProcessExited, "No server process"));
    }
    auto& child = *process_->child;
    child.CloseStdin();
    auto output = child.ReadToEnd(deadline);
    if (output.IsErr()) {
        return output;
    }
    child.DrainStderr(deadline.Cap(options_.exit_grace));
    auto status = child.WaitFor(deadline.Remaining(options_.exit_grace));
    if (status.has_value() && !status->Success()) {
        auto error = MakeSupervisorError(ErrorKind::ProcessExited,
            "MCP server " + status->Describe());
        if (!child.StderrTail().empty()) {
            error.detail = child.StderrTail();
        }
        return Result<std::string, Error>::Err(std::move(error));
    }
    if (!child.StderrTail().empty()) {
        LogDebug("supervisor", "MCP server stderr: " + Truncate(child.StderrTail(), 200));
    }
    return output;
}

bool ServerSupervisor::IsReady() const noexcept {
    return process_.has_value() && process_->ready;
}

bool ServerSupervisor::IsAlive() {
    return process_.has_value() && process_->child->IsRunning();
}

std::optional<pid_t> ServerSupervisor::Pid() const {
    if (!process_.has_value()) {
        return std::nullopt;
    }
    return process_->child->Pid();
}

std::string ServerSupervisor::StderrTail() const {
    return process_.has_value() ? process_->child->StderrTail() : std::string{};
}

void ServerSupervisor::Kill() {
    if (!process_.has_value()) {
        return;
    }
    auto pid = process_->child->Pid();
    process_->child->Kill();
    process_.reset();
    LogDebug("supervisor", "Server process " + std::to_string(pid) + " released");
}

Error ServerSupervisor::ExitError(ErrorKind kind, const std::string& operation,
                                  const std::string& what, const Deadline& deadline) {
    auto& child = *process_->child;
    if (options_.capture_stderr_on_exit) {
        child.DrainStderr(deadline.Cap(options_.exit_grace));
    }

    auto error = Error::Make(kind, operation, what);
    if (auto status = child.WaitFor(options_.exit_grace)) {
        error.message += ": server " + status->Describe();
    } else {
        error.message += ": server still running";
    }

    const auto& tail = child.StderrTail();
    if (!tail.empty()) {
        if (options_.capture_stderr_on_exit) {
            error.detail = tail;
        }
        LogDebug("supervisor", "MCP server stderr: " + Truncate(tail, 200));
    }
    return error;
}

} // namespace superbox
