#pragma once

#include <superbox/core/deadline.hpp>
#include <superbox/core/result.hpp>
#include <superbox/process/child_process.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace superbox {

// ---------------------------------------------------------------------------
// SupervisorOptions: how server processes are launched and greeted.
// ---------------------------------------------------------------------------
struct SupervisorOptions {
    std::string python_executable = "python3";
    std::string dependency_dir = "/tmp/pip_modules";
    std::string protocol_version = "2025-11-25";
    std::string client_name = "superbox";
    std::string client_version;               // empty: the bridge version
    std::chrono::milliseconds exit_grace{500}; // wait for an exit status after EOF
    bool capture_stderr_on_exit = false;       // attach drained stderr to exit errors
};

// ---------------------------------------------------------------------------
// ServerProcess: the one live child a supervisor owns.
// ---------------------------------------------------------------------------
struct ServerProcess {
    std::unique_ptr<ChildProcess> child;
    std::filesystem::path workspace;
    std::chrono::system_clock::time_point started_at;
    bool ready = false;
};

// ---------------------------------------------------------------------------
// ServerSupervisor: spawn, handshake, line I/O, health check and kill for
// exactly one MCP server process.
//
// Lifecycle: Spawn -> Handshake -> (Send -> ReceiveLine)* -> Kill.
// Reads and writes are strictly half-duplex; the caller never issues a Send
// while a ReceiveLine is outstanding. The destructor kills the child.
// ---------------------------------------------------------------------------
class ServerSupervisor {
public:
    explicit ServerSupervisor(SupervisorOptions options = {});
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;
    ServerSupervisor(ServerSupervisor&&) = delete;
    ServerSupervisor& operator=(ServerSupervisor&&) = delete;

    // Launch <python> <workspace>/<entrypoint> with cwd = workspace.
    // UnsupportedLanguage, EntrypointMissing, SpawnError.
    [[nodiscard]] Result<void, Error> Spawn(const std::filesystem::path& workspace,
                                            const std::string& entrypoint,
                                            const std::string& language);

    // initialize request, one response line, initialized notification.
    // HandshakeFailure if the child's output ends first.
    [[nodiscard]] Result<void, Error> Handshake(const Deadline& deadline = Deadline::Never());

    // One newline-terminated line to the child. BrokenPipe once it has exited.
    [[nodiscard]] Result<void, Error> Send(std::string_view message);

    // Block for one line. ProcessExited at end of output, Timeout past deadline.
    [[nodiscard]] Result<std::string, Error> ReceiveLine(
        const Deadline& deadline = Deadline::Never());

    // Close the child's stdin and collect its remaining output until exit.
    [[nodiscard]] Result<std::string, Error> DrainOutput(const Deadline& deadline);

    [[nodiscard]] bool HasProcess() const noexcept { return process_.has_value(); }
    [[nodiscard]] bool IsReady() const noexcept;
    [[nodiscard]] bool IsAlive();
    [[nodiscard]] std::optional<pid_t> Pid() const;
    [[nodiscard]] std::string StderrTail() const;

    // Idempotent: no-op when there is no process or it is already dead.
    void Kill();

    // The exact handshake lines, without the trailing newline.
    [[nodiscard]] std::string InitializeRequest() const;
    [[nodiscard]] static std::string InitializedNotification();

private:
    // Turn end-of-output into a report carrying the exit status.
    Error ExitError(ErrorKind kind, const std::string& operation,
                    const std::string& what, const Deadline& deadline);

    SupervisorOptions options_;
    std::optional<ServerProcess> process_;
};

// PYTHONPATH for a server: "<deps>:<workspace>:<inherited>", each part only
// when present.
std::string BuildPythonPath(const std::filesystem::path& workspace,
                            const std::optional<std::string>& dependency_dir,
                            const char* inherited);

} // namespace superbox
