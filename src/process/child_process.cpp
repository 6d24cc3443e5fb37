#include <superbox/process/child_process.hpp>

#include <superbox/core/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace superbox {

namespace {

constexpr size_t kReadChunk = 4096;

Error MakeProcessError(ErrorKind kind, const std::string& message) {
    return Error::Make(kind, "ChildProcess", message);
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

// Writes to a child whose stdin is gone must surface as EPIPE, not kill us.
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

ExitStatus DecodeWaitStatus(int raw) {
    if (WIFSIGNALED(raw)) {
        return ExitStatus{true, WTERMSIG(raw)};
    }
    if (WIFEXITED(raw)) {
        return ExitStatus{false, WEXITSTATUS(raw)};
    }
    return ExitStatus{false, -1};
}

std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv{*entry};
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) continue;
        merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

bool MakePipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

// Child side after fork: only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(int stdin_fd, int stdout_fd, int stderr_fd,
                            int report_fd, const char* working_directory,
                            const char* path, char* const argv[], char* const envp[]) {
    auto fail = [report_fd]() {
        int err = errno;
        ssize_t ignored = ::write(report_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    };

    ::setpgid(0, 0);
    if (::dup2(stdin_fd, STDIN_FILENO) < 0) fail();
    if (::dup2(stdout_fd, STDOUT_FILENO) < 0) fail();
    if (::dup2(stderr_fd, STDERR_FILENO) < 0) fail();

    if (working_directory != nullptr && ::chdir(working_directory) != 0) fail();

    ::signal(SIGPIPE, SIG_DFL);
    ::execve(path, argv, envp);
    fail();
    _exit(127);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// UniqueFd
// ---------------------------------------------------------------------------
void UniqueFd::Reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

// ---------------------------------------------------------------------------
// ExitStatus
// ---------------------------------------------------------------------------
std::string ExitStatus::Describe() const {
    std::ostringstream oss;
    if (signaled) {
        oss << "terminated by signal " << code;
    } else {
        oss << "exited with code " << code;
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// FindExecutable
// ---------------------------------------------------------------------------
std::optional<std::string> FindExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(
    const SpawnOptions& options) {
    using R = Result<std::unique_ptr<ChildProcess>, Error>;

    if (options.argv.empty()) {
        return R::Err(MakeProcessError(ErrorKind::SpawnError, "Empty command line"));
    }

    auto executable = FindExecutable(options.argv[0]);
    if (!executable.has_value()) {
        return R::Err(MakeProcessError(ErrorKind::SpawnError,
            "Executable not found: " + options.argv[0]));
    }

    IgnoreSigpipeOnce();

    // Everything the child needs is prepared before fork().
    std::vector<std::string> args = options.argv;
    args[0] = *executable;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    auto env = BuildEnvironment(options.environment);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    UniqueFd stdin_read, stdin_write;
    UniqueFd stdout_read, stdout_write;
    UniqueFd stderr_read, stderr_write;
    UniqueFd report_read, report_write;

    if (options.pipe_stdin) {
        if (!MakePipe(stdin_read, stdin_write)) {
            return R::Err(MakeProcessError(ErrorKind::SpawnError,
                "pipe() failed: " + ErrnoText(errno)));
        }
    } else {
        stdin_read.Reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!stdin_read.Valid()) {
            return R::Err(MakeProcessError(ErrorKind::SpawnError,
                "open(/dev/null) failed: " + ErrnoText(errno)));
        }
    }
    if (!MakePipe(stdout_read, stdout_write) ||
        !MakePipe(stderr_read, stderr_write) ||
        !MakePipe(report_read, report_write)) {
        return R::Err(MakeProcessError(ErrorKind::SpawnError,
            "pipe() failed: " + ErrnoText(errno)));
    }

    const char* cwd = options.working_directory.empty()
        ? nullptr : options.working_directory.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        return R::Err(MakeProcessError(ErrorKind::SpawnError,
            "fork() failed: " + ErrnoText(errno)));
    }
    if (pid == 0) {
        ExecChild(stdin_read.Get(), stdout_write.Get(), stderr_write.Get(),
                  report_write.Get(), cwd, args[0].c_str(), argv.data(), envp.data());
    }

    // Parent: drop the child's ends. The report pipe reads EOF on a
    // successful exec (CLOEXEC), or the child's errno on failure.
    stdin_read.Reset();
    stdout_write.Reset();
    stderr_write.Reset();
    report_write.Reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report_read.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {}
        return R::Err(MakeProcessError(ErrorKind::SpawnError,
            "Failed to start " + options.argv[0] + ": " + ErrnoText(child_errno)));
    }

    LogDebug("process", "Spawned pid " + std::to_string(pid) + ": " + args[0]);

    return R::Ok(std::make_unique<ChildProcess>(
        SpawnedTag{}, pid, std::move(stdin_write), std::move(stdout_read),
        std::move(stderr_read)));
}

ChildProcess::ChildProcess(SpawnedTag, pid_t pid, UniqueFd stdin_fd, UniqueFd stdout_fd,
                           UniqueFd stderr_fd)
    : pid_(pid),
      stdin_(std::move(stdin_fd)),
      stdout_(std::move(stdout_fd)),
      stderr_(std::move(stderr_fd)) {}

ChildProcess::~ChildProcess() {
    Kill();
}

Result<void, Error> ChildProcess::Write(std::string_view data) {
    if (!stdin_.Valid()) {
        return Result<void, Error>::Err(
            MakeProcessError(ErrorKind::BrokenPipe, "Child stdin is closed"));
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_.Get(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            if (err == EPIPE) {
                stdin_.Reset();
            }
            return Result<void, Error>::Err(MakeProcessError(ErrorKind::BrokenPipe,
                "Write to child failed: " + ErrnoText(err)));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

void ChildProcess::CloseStdin() {
    stdin_.Reset();
}

void ChildProcess::AppendStderr(const char* data, size_t size) {
    stderr_tail_.append(data, size);
    if (stderr_tail_.size() > kStderrTailLimit) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailLimit);
    }
}

Result<void, Error> ChildProcess::Pump(const Deadline& deadline) {
    pollfd fds[2];
    nfds_t count = 0;
    if (!stdout_eof_ && stdout_.Valid()) {
        fds[count++] = pollfd{stdout_.Get(), POLLIN, 0};
    }
    if (!stderr_eof_ && stderr_.Valid()) {
        fds[count++] = pollfd{stderr_.Get(), POLLIN, 0};
    }
    if (count == 0) {
        return Result<void, Error>::Ok();
    }

    int rc = ::poll(fds, count, deadline.PollTimeoutMs());
    if (rc < 0) {
        if (errno == EINTR) {
            return Result<void, Error>::Ok();
        }
        return Result<void, Error>::Err(MakeProcessError(ErrorKind::Internal,
            "poll() failed: " + ErrnoText(errno)));
    }

    char buf[kReadChunk];
    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }
        const bool is_stdout = fds[i].fd == stdout_.Get();
        ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (n <= 0) {
            (is_stdout ? stdout_eof_ : stderr_eof_) = true;
            continue;
        }
        if (is_stdout) {
            stdout_buffer_.append(buf, static_cast<size_t>(n));
        } else {
            AppendStderr(buf, static_cast<size_t>(n));
        }
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ChildProcess::ReadLine(const Deadline& deadline) {
    for (;;) {
        auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return Result<std::string, Error>::Ok(std::move(line));
        }
        if (stdout_eof_ || !stdout_.Valid()) {
            if (!stdout_buffer_.empty()) {
                std::string rest = std::move(stdout_buffer_);
                stdout_buffer_.clear();
                return Result<std::string, Error>::Ok(std::move(rest));
            }
            return Result<std::string, Error>::Err(MakeProcessError(
                ErrorKind::ProcessExited, "Child closed its output"));
        }
        if (deadline.Expired()) {
            return Result<std::string, Error>::Err(MakeProcessError(
                ErrorKind::Timeout, "Timed out waiting for child output"));
        }
        auto pumped = Pump(deadline);
        if (pumped.IsErr()) {
            return Result<std::string, Error>::Err(std::move(pumped).Error());
        }
    }
}

Result<std::string, Error> ChildProcess::ReadToEnd(const Deadline& deadline) {
    while (!stdout_eof_ && stdout_.Valid()) {
        if (deadline.Expired()) {
            return Result<std::string, Error>::Err(MakeProcessError(
                ErrorKind::Timeout, "Timed out waiting for child to finish output"));
        }
        auto pumped = Pump(deadline);
        if (pumped.IsErr()) {
            return Result<std::string, Error>::Err(std::move(pumped).Error());
        }
    }
    std::string all = std::move(stdout_buffer_);
    stdout_buffer_.clear();
    return Result<std::string, Error>::Ok(std::move(all));
}

void ChildProcess::DrainStderr(const Deadline& deadline) {
    while (!stderr_eof_ && stderr_.Valid() && !deadline.Expired()) {
        if (Pump(deadline).IsErr()) {
            return;
        }
    }
}

bool ChildProcess::IsRunning() {
    if (reaped_) {
        return false;
    }
    int raw = 0;
    pid_t rc = ::waitpid(pid_, &raw, WNOHANG);
    if (rc == 0) {
        return true;
    }
    reaped_ = true;
    if (rc == pid_) {
        status_ = DecodeWaitStatus(raw);
    }
    return false;
}

std::optional<ExitStatus> ChildProcess::WaitFor(std::chrono::milliseconds grace) {
    auto deadline = Deadline::After(grace);
    while (IsRunning()) {
        if (deadline.Expired()) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return status_;
}

void ChildProcess::Kill() {
    if (pid_ > 0 && !group_killed_) {
        // Group first so helpers the server started die with it.
        if (::kill(-pid_, SIGKILL) != 0 && !reaped_) {
            ::kill(pid_, SIGKILL);
        }
        group_killed_ = true;
    }
    if (!reaped_ && pid_ > 0) {
        int raw = 0;
        pid_t rc;
        do {
            rc = ::waitpid(pid_, &raw, 0);
        } while (rc < 0 && errno == EINTR);
        reaped_ = true;
        if (rc == pid_ && !status_.has_value()) {
            status_ = DecodeWaitStatus(raw);
        }
        LogDebug("process", "Killed pid " + std::to_string(pid_));
    }
    stdin_.Reset();
    stdout_.Reset();
    stderr_.Reset();
    stdout_eof_ = true;
    stderr_eof_ = true;
}

void KillProcessGroup(pid_t group) {
    if (group > 0 && ::kill(-group, SIGKILL) != 0 && errno != ESRCH) {
        LogDebug("process", "kill(-" + std::to_string(group) + ") failed: " + ErrnoText(errno));
    }
}

// ---------------------------------------------------------------------------
// RunCommand
// ---------------------------------------------------------------------------
Result<CommandResult, Error> RunCommand(const SpawnOptions& options,
                                        const Deadline& deadline) {
    SpawnOptions tool_options = options;
    tool_options.pipe_stdin = false;

    auto spawned = ChildProcess::Spawn(tool_options);
    if (spawned.IsErr()) {
        return Result<CommandResult, Error>::Err(std::move(spawned).Error());
    }
    auto child = std::move(spawned).Value();

    auto output = child->ReadToEnd(deadline);
    if (output.IsErr()) {
        child->Kill();
        return Result<CommandResult, Error>::Err(std::move(output).Error());
    }
    child->DrainStderr(deadline);

    // Output is closed; the tool is on its way out.
    auto status = child->WaitFor(deadline.Remaining(std::chrono::seconds{5}));
    if (!status.has_value()) {
        child->Kill();
        if (deadline.Expired()) {
            return Result<CommandResult, Error>::Err(MakeProcessError(
                ErrorKind::Timeout, "Timed out waiting for " + options.argv[0] + " to exit"));
        }
        status = child->Status();
    }

    CommandResult result;
    result.status = status.value_or(ExitStatus{false, -1});
    result.stdout_text = std::move(output).Value();
    result.stderr_text = child->StderrTail();
    return Result<CommandResult, Error>::Ok(std::move(result));
}

} // namespace superbox
