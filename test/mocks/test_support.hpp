#pragma once

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/types.h>

namespace superbox {
namespace testing {

// ---------------------------------------------------------------------------
// TempDir: a fresh directory under the system temp dir, removed on scope
// exit.
// ---------------------------------------------------------------------------
class TempDir {
public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "superbox_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream body;
    body << in.rdbuf();
    return body.str();
}

inline std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// True once `pid` no longer exists (killed and reaped).
inline bool ProcessGone(pid_t pid) {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

// True once `pid` is gone or a zombie nobody has reaped yet (orphans in a
// container whose init does not reap).
inline bool ProcessDead(pid_t pid) {
    if (ProcessGone(pid)) {
        return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    if (!std::getline(stat, content)) {
        return true;
    }
    auto paren = content.rfind(')');
    return paren != std::string::npos && paren + 2 < content.size() &&
           content[paren + 2] == 'Z';
}

// Environment variable the scripts below write their pid to, when set.
constexpr const char* kPidFileEnv = "SUPERBOX_TEST_PID_FILE";

// ---------------------------------------------------------------------------
// Python MCP servers used by process and bridge tests.
// ---------------------------------------------------------------------------

// Answers every request: initialize with serverInfo, "env" with its
// PYTHONPATH and cwd, anything else by echoing the request back. Every raw
// input line is appended to received.log in the working directory.
constexpr const char* kEchoServer = R"PY(import json
import os
import sys

pid_file = os.environ.get("SUPERBOX_TEST_PID_FILE")
if pid_file:
    with open(pid_file, "w") as f:
        f.write(str(os.getpid()))

for raw in sys.stdin:
    line = raw.strip()
    if not line:
        continue
    with open("received.log", "a") as log:
        log.write(line + "\n")
    try:
        msg = json.loads(line)
    except ValueError:
        print(json.dumps({"jsonrpc": "2.0", "id": None, "error": {"code": -32700, "message": "Parse error"}}), flush=True)
        continue
    if "id" not in msg or "method" not in msg:
        continue
    method = msg["method"]
    if method == "initialize":
        result = {"protocolVersion": msg["params"]["protocolVersion"],
                  "capabilities": {},
                  "serverInfo": {"name": "echo", "version": "1.0"}}
    elif method == "env":
        result = {"pythonpath": os.environ.get("PYTHONPATH", ""), "cwd": os.getcwd()}
    elif method == "exit":
        sys.exit(0)
    else:
        result = {"echo": msg}
    print(json.dumps({"jsonrpc": "2.0", "id": msg["id"], "result": result}), flush=True)
)PY";

// Writes to stderr and exits with code 3 before reading anything.
constexpr const char* kCrashingServer = R"PY(import sys
sys.stderr.write("boom: missing API key\n")
sys.stderr.flush()
sys.exit(3)
)PY";

// Completes the handshake, then never answers again.
constexpr const char* kSilentServer = R"PY(import json
import os
import sys
import time

pid_file = os.environ.get("SUPERBOX_TEST_PID_FILE")
if pid_file:
    with open(pid_file, "w") as f:
        f.write(str(os.getpid()))

line = sys.stdin.readline()
msg = json.loads(line)
print(json.dumps({"jsonrpc": "2.0", "id": msg["id"], "result": {}}), flush=True)
while True:
    time.sleep(1)
)PY";

// Answers the handshake, then prints every later line it receives
// (prefixed) and exits on EOF.
constexpr const char* kBatchServer = R"PY(import json
import sys

line = sys.stdin.readline()
msg = json.loads(line)
print(json.dumps({"jsonrpc": "2.0", "id": msg["id"], "result": {}}), flush=True)
sys.stdin.readline()  # notifications/initialized
for raw in sys.stdin:
    print("got " + raw.strip(), flush=True)
)PY";

} // namespace testing
} // namespace superbox
