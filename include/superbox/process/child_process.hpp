#pragma once

#include <superbox/core/deadline.hpp>
#include <superbox/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace superbox {

// ---------------------------------------------------------------------------
// UniqueFd: owns one file descriptor, closes it on destruction.
// ---------------------------------------------------------------------------
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool Valid() const noexcept { return fd_ >= 0; }

    int Release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

// ---------------------------------------------------------------------------
// ExitStatus: how a reaped child ended.
// ---------------------------------------------------------------------------
struct ExitStatus {
    bool signaled = false;
    int code = 0; // exit code, or signal number when signaled

    [[nodiscard]] bool Success() const noexcept { return !signaled && code == 0; }

    // "exited with code 1" / "terminated by signal 9"
    [[nodiscard]] std::string Describe() const;
};

// ---------------------------------------------------------------------------
// SpawnOptions: what to launch and where.
// ---------------------------------------------------------------------------
struct SpawnOptions {
    std::vector<std::string> argv;     // argv[0] is looked up in PATH if bare
    std::string working_directory;     // empty: inherit
    std::map<std::string, std::string> environment; // merged over our own
    bool pipe_stdin = true;            // false: stdin is /dev/null
};

// ---------------------------------------------------------------------------
// ChildProcess: one forked child with piped stdio.
//
// stdout is consumed line by line; stderr is read whenever the child is
// polled so it can never block on a full pipe, and only its last 64 KiB are
// kept. The child leads its own process group; Kill() signals the group.
//
// Not thread-safe: one owner drives reads and writes in lock-step.
// ---------------------------------------------------------------------------
class ChildProcess {
    struct SpawnedTag {};

public:
    static constexpr size_t kStderrTailLimit = 64 * 1024;

    [[nodiscard]] static Result<std::unique_ptr<ChildProcess>, Error> Spawn(
        const SpawnOptions& options);

    // Only Spawn() can name the tag.
    ChildProcess(SpawnedTag, pid_t pid, UniqueFd stdin_fd, UniqueFd stdout_fd,
                 UniqueFd stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    // Write all of `data` to stdin. BrokenPipe if the child is gone or
    // stdin was closed.
    [[nodiscard]] Result<void, Error> Write(std::string_view data);

    // Signal EOF on the child's stdin.
    void CloseStdin();

    // Next line from stdout, without the terminator ("\n" or "\r\n").
    // A final unterminated chunk before EOF counts as a line.
    // ProcessExited on EOF with nothing buffered; Timeout past the deadline.
    [[nodiscard]] Result<std::string, Error> ReadLine(const Deadline& deadline);

    // Everything left on stdout until EOF. Timeout past the deadline.
    [[nodiscard]] Result<std::string, Error> ReadToEnd(const Deadline& deadline);

    // Read stderr until EOF or the deadline, whichever comes first.
    void DrainStderr(const Deadline& deadline);

    [[nodiscard]] const std::string& StderrTail() const noexcept { return stderr_tail_; }

    // Non-blocking health check; reaps the child if it has exited.
    [[nodiscard]] bool IsRunning();

    // Wait up to `grace` for the child to exit on its own.
    std::optional<ExitStatus> WaitFor(std::chrono::milliseconds grace);

    [[nodiscard]] std::optional<ExitStatus> Status() const { return status_; }

    // SIGKILL the process group, reap, close every handle. Idempotent.
    // The group is signalled even when the leader was already reaped by
    // IsRunning(), so helpers it left behind die too.
    void Kill();

private:

    // One poll(2) round over the open output pipes.
    [[nodiscard]] Result<void, Error> Pump(const Deadline& deadline);
    void AppendStderr(const char* data, size_t size);

    pid_t pid_ = -1;
    bool reaped_ = false;
    bool group_killed_ = false;
    std::optional<ExitStatus> status_;

    UniqueFd stdin_;
    UniqueFd stdout_;
    UniqueFd stderr_;
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;

    std::string stdout_buffer_;
    std::string stderr_tail_;
};

// ---------------------------------------------------------------------------
// RunCommand: run a helper tool (unzip, pip) to completion.
// ---------------------------------------------------------------------------
struct CommandResult {
    ExitStatus status;
    std::string stdout_text;
    std::string stderr_text; // tail only
};

// Timeout kills the tool and returns a Timeout error; a non-zero exit is NOT
// an error here, callers inspect `status`.
[[nodiscard]] Result<CommandResult, Error> RunCommand(const SpawnOptions& options,
                                                      const Deadline& deadline);

// SIGKILL every process in `group`. Safe from any thread.
void KillProcessGroup(pid_t group);

// Absolute path of `name` via PATH, or nullopt. Names containing '/' are
// returned unchanged when the file is executable.
std::optional<std::string> FindExecutable(const std::string& name);

} // namespace superbox
