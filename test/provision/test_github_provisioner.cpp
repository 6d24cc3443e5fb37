#include <catch2/catch_test_macros.hpp>

#include <superbox/provision/github_provisioner.hpp>

#include <superbox/process/child_process.hpp>

#include "mocks/local_server.hpp"
#include "mocks/test_support.hpp"

#include <httplib.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

using namespace superbox;
using namespace superbox::testing;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

ServerName Name(const char* value) {
    return ServerName::Create(value).Value();
}

std::string Archive(const std::string& url) {
    auto resolved = ResolveArchiveUrl(url, "main");
    return resolved.IsOk() ? resolved.Value() : "<" + resolved.Error().message + ">";
}

// Stand-in interpreter that records its argv and working directory.
void WriteRecordingInterpreter(const fs::path& path, int exit_code) {
    WriteFile(path, "#!/bin/sh\n"
                    "pwd > \"$(dirname \"$0\")/cwd.txt\"\n"
                    "printf '%s\\n' \"$*\" > \"$(dirname \"$0\")/args.txt\"\n"
                    "echo 'no matching distribution' >&2\n"
                    "exit " + std::to_string(exit_code) + "\n");
    ::chmod(path.c_str(), 0755);
}

// Zip the tree under `source` (paths relative to it) with python's zipfile
// and return the archive bytes.
std::string MakeZip(const fs::path& source, const fs::path& out) {
    SpawnOptions zip;
    zip.argv = {"python3", "-c",
                "import os, sys, zipfile\n"
                "src, out = sys.argv[1], sys.argv[2]\n"
                "with zipfile.ZipFile(out, 'w') as z:\n"
                "    for base, _, names in os.walk(src):\n"
                "        for n in names:\n"
                "            p = os.path.join(base, n)\n"
                "            z.write(p, os.path.relpath(p, src))\n",
                source.string(), out.string()};
    auto run = RunCommand(zip, Deadline::After(30s));
    REQUIRE(run.IsOk());
    REQUIRE(run.Value().status.Success());
    return ReadFile(out);
}

constexpr const char* kArchivePath = "/acme/echo/archive/refs/heads/main.zip";

// A provisioner fetching archives from a loopback server instead of GitHub.
struct ArchiveFixture {
    TempDir dir;
    fs::path root = dir.Path() / "workspaces";
    httplib::Server svr;

    Result<Workspace, Error> Materialize(const LocalServer& server) {
        ProvisionOptions options;
        options.workspace_root = root;
        options.archive_base = server.Url();
        GithubProvisioner provisioner(options);
        return provisioner.Materialize("https://github.com/acme/echo", Name("echo"),
                                       Deadline::After(30s));
    }

    [[nodiscard]] bool RootEmpty() const {
        return !fs::exists(root) || fs::is_empty(root);
    }
};

} // anonymous namespace

// ===========================================================================
// ResolveArchiveUrl
// ===========================================================================

TEST_CASE("ResolveArchiveUrl: GitHub repository forms", "[provision]") {
    const std::string expected =
        "https://github.com/acme/weather/archive/refs/heads/main.zip";
    CHECK(Archive("https://github.com/acme/weather") == expected);
    CHECK(Archive("https://github.com/acme/weather/") == expected);
    CHECK(Archive("https://github.com/acme/weather.git") == expected);
    CHECK(Archive("http://github.com/acme/weather") == expected);
    CHECK(Archive("https://www.github.com/acme/weather") == expected);
    CHECK(Archive("https://github.com/my-org/mcp.server_v2") ==
          "https://github.com/my-org/mcp.server_v2/archive/refs/heads/main.zip");
}

TEST_CASE("ResolveArchiveUrl: branch is configurable", "[provision]") {
    auto resolved = ResolveArchiveUrl("https://github.com/acme/weather", "develop");
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value() == "https://github.com/acme/weather/archive/refs/heads/develop.zip");
}

TEST_CASE("ResolveArchiveUrl: archive origin is configurable", "[provision]") {
    auto resolved = ResolveArchiveUrl("https://github.com/acme/weather.git", "main",
                                      "http://127.0.0.1:8081");
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value() == "http://127.0.0.1:8081/acme/weather/archive/refs/heads/main.zip");
}

TEST_CASE("ResolveArchiveUrl: everything else is UnsupportedSource", "[provision]") {
    for (const char* url : {"https://gitlab.com/acme/weather",
                            "git@github.com:acme/weather.git",
                            "https://github.com/acme",
                            "https://github.com/acme/weather/tree/main",
                            "https://github.com/../weather",
                            "https://github.com.evil.io/acme/weather",
                            "ftp://github.com/acme/weather",
                            ""}) {
        CAPTURE(url);
        auto resolved = ResolveArchiveUrl(url, "main");
        REQUIRE(resolved.IsErr());
        CHECK(resolved.Error().kind == ErrorKind::UnsupportedSource);
    }
}

TEST_CASE("GithubProvisioner: unsupported source leaves nothing behind", "[provision]") {
    TempDir root;
    ProvisionOptions options;
    options.workspace_root = root.Path();
    GithubProvisioner provisioner(options);

    auto workspace = provisioner.Materialize("https://gitlab.com/acme/weather",
                                             Name("weather"), Deadline::After(5s));
    REQUIRE(workspace.IsErr());
    CHECK(workspace.Error().kind == ErrorKind::UnsupportedSource);
    CHECK(workspace.Error().message ==
          "Only GitHub repositories are supported: https://gitlab.com/acme/weather");
    CHECK(fs::is_empty(root.Path()));
}

TEST_CASE("GithubProvisioner: missing archive leaves nothing behind", "[provision][live]") {
    ArchiveFixture f;
    LocalServer server(f.svr);

    auto workspace = f.Materialize(server);
    REQUIRE(workspace.IsErr());
    CHECK(workspace.Error().kind == ErrorKind::ProvisionError);
    CHECK(workspace.Error().message.find("returned HTTP 404") != std::string::npos);
    CHECK(f.RootEmpty());
}

TEST_CASE("GithubProvisioner: empty archive body", "[provision][live]") {
    ArchiveFixture f;
    f.svr.Get(kArchivePath, [](const httplib::Request&, httplib::Response& res) {
        res.set_content("", "application/zip");
    });
    LocalServer server(f.svr);

    auto workspace = f.Materialize(server);
    REQUIRE(workspace.IsErr());
    CHECK(workspace.Error().kind == ErrorKind::ProvisionError);
    CHECK(workspace.Error().message.find("is empty") != std::string::npos);
    CHECK(f.RootEmpty());
}

TEST_CASE("GithubProvisioner: corrupt archive fails extraction", "[provision][live]") {
    ArchiveFixture f;
    f.svr.Get(kArchivePath, [](const httplib::Request&, httplib::Response& res) {
        res.set_content("this is not a zip archive", "application/zip");
    });
    LocalServer server(f.svr);

    auto workspace = f.Materialize(server);
    REQUIRE(workspace.IsErr());
    CHECK(workspace.Error().kind == ErrorKind::ProvisionError);
    CHECK(workspace.Error().message.rfind("unzip exited with code", 0) == 0);
    CHECK(f.RootEmpty());
}

TEST_CASE("GithubProvisioner: archive is extracted and flattened", "[provision][live]") {
    ArchiveFixture f;
    auto source = f.dir.Path() / "source";
    WriteFile(source / "echo-main" / "main.py", "print('hi')\n");
    WriteFile(source / "echo-main" / "pkg" / "util.py", "X = 1\n");
    const auto zip = MakeZip(source, f.dir.Path() / "echo.zip");

    std::string requested;
    f.svr.Get(kArchivePath, [&zip, &requested](const httplib::Request& req,
                                               httplib::Response& res) {
        requested = req.path;
        res.set_content(zip, "application/zip");
    });
    LocalServer server(f.svr);

    auto workspace = f.Materialize(server);
    REQUIRE(workspace.IsOk());
    const auto& ws = workspace.Value();
    CHECK(requested == kArchivePath);
    CHECK(ws.root.parent_path() == f.root);
    CHECK(ws.root.filename().string().rfind("mcp_echo_", 0) == 0);
    CHECK(ws.path == ws.root / "repo");
    CHECK(ReadFile(ws.path / "main.py") == "print('hi')\n");
    CHECK(ReadFile(ws.path / "pkg" / "util.py") == "X = 1\n");

    // Only the flattened tree remains.
    std::vector<std::string> entries;
    for (const auto& entry : fs::directory_iterator(ws.root)) {
        entries.push_back(entry.path().filename().string());
    }
    CHECK(entries == std::vector<std::string>{"repo"});

    RemoveWorkspace(ws);
    CHECK(f.RootEmpty());
}

TEST_CASE("GithubProvisioner: archive redirect is followed", "[provision][live]") {
    ArchiveFixture f;
    auto source = f.dir.Path() / "source";
    WriteFile(source / "echo-main" / "main.py", "print('hi')\n");
    const auto zip = MakeZip(source, f.dir.Path() / "echo.zip");

    f.svr.Get(kArchivePath, [](const httplib::Request&, httplib::Response& res) {
        res.set_redirect("/codeload/echo.zip");
    });
    f.svr.Get("/codeload/echo.zip", [&zip](const httplib::Request&, httplib::Response& res) {
        res.set_content(zip, "application/zip");
    });
    LocalServer server(f.svr);

    auto workspace = f.Materialize(server);
    REQUIRE(workspace.IsOk());
    CHECK(fs::exists(workspace.Value().path / "main.py"));
    RemoveWorkspace(workspace.Value());
}

// ===========================================================================
// Workspace helpers
// ===========================================================================

TEST_CASE("MakeTempDirectory: unique directories under the parent", "[provision]") {
    TempDir root;
    auto first = MakeTempDirectory(root.Path(), "mcp_weather_");
    auto second = MakeTempDirectory(root.Path(), "mcp_weather_");
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    CHECK(first.Value() != second.Value());
    CHECK(fs::is_directory(first.Value()));
    CHECK(first.Value().parent_path() == root.Path());
    CHECK(first.Value().filename().string().rfind("mcp_weather_", 0) == 0);

    RemoveWorkspace({first.Value(), first.Value() / "repo"});
    CHECK_FALSE(fs::exists(first.Value()));
}

TEST_CASE("MakeTempDirectory: missing parent is created", "[provision]") {
    TempDir root;
    auto made = MakeTempDirectory(root.Path() / "workspaces", "mcp_x_");
    REQUIRE(made.IsOk());
    CHECK(made.Value().parent_path() == root.Path() / "workspaces");
}

TEST_CASE("FlattenInto: single top-level directory is hoisted", "[provision]") {
    TempDir root;
    WriteFile(root.Path() / "extract" / "weather-main" / "main.py", "print(1)\n");
    WriteFile(root.Path() / "extract" / "weather-main" / "pkg" / "util.py", "");

    REQUIRE(FlattenInto(root.Path() / "extract", root.Path() / "repo").IsOk());
    CHECK(fs::is_regular_file(root.Path() / "repo" / "main.py"));
    CHECK(fs::is_regular_file(root.Path() / "repo" / "pkg" / "util.py"));
    CHECK_FALSE(fs::exists(root.Path() / "repo" / "weather-main"));
}

TEST_CASE("FlattenInto: several entries are moved as they are", "[provision]") {
    TempDir root;
    WriteFile(root.Path() / "extract" / "main.py", "");
    WriteFile(root.Path() / "extract" / "lib" / "a.py", "");

    REQUIRE(FlattenInto(root.Path() / "extract", root.Path() / "repo").IsOk());
    CHECK(fs::is_regular_file(root.Path() / "repo" / "main.py"));
    CHECK(fs::is_regular_file(root.Path() / "repo" / "lib" / "a.py"));
}

TEST_CASE("FlattenInto: single file is not hoisted", "[provision]") {
    TempDir root;
    WriteFile(root.Path() / "extract" / "main.py", "");

    REQUIRE(FlattenInto(root.Path() / "extract", root.Path() / "repo").IsOk());
    CHECK(fs::is_regular_file(root.Path() / "repo" / "main.py"));
}

TEST_CASE("FlattenInto: empty archive", "[provision]") {
    TempDir root;
    fs::create_directories(root.Path() / "extract");
    auto flattened = FlattenInto(root.Path() / "extract", root.Path() / "repo");
    REQUIRE(flattened.IsErr());
    CHECK(flattened.Error().kind == ErrorKind::ProvisionError);
    CHECK(flattened.Error().message == "Archive is empty");
}

// ===========================================================================
// InstallDependencies
// ===========================================================================

TEST_CASE("InstallDependencies: nothing to do without requirements.txt", "[provision]") {
    TempDir root;
    fs::create_directories(root.Path() / "repo");
    ProvisionOptions options;
    options.dependency_dir = (root.Path() / "deps").string();
    options.python_executable = "/nonexistent/python";
    GithubProvisioner provisioner(options);

    CHECK_FALSE(provisioner.InstallDependencies({root.Path(), root.Path() / "repo"},
                                                Deadline::After(5s)).has_value());
    CHECK_FALSE(fs::exists(root.Path() / "deps"));
}

TEST_CASE("InstallDependencies: pip --target into the dependency dir", "[provision]") {
    TempDir root;
    TempDir tools;
    WriteFile(root.Path() / "repo" / "requirements.txt", "requests\n");
    WriteRecordingInterpreter(tools.Path() / "python", 0);

    ProvisionOptions options;
    options.dependency_dir = (root.Path() / "deps").string();
    options.python_executable = (tools.Path() / "python").string();
    GithubProvisioner provisioner(options);

    auto failure = provisioner.InstallDependencies({root.Path(), root.Path() / "repo"},
                                                   Deadline::After(10s));
    CHECK_FALSE(failure.has_value());
    CHECK(fs::is_directory(root.Path() / "deps"));

    auto args = ReadLines(tools.Path() / "args.txt");
    REQUIRE(args.size() == 1);
    CHECK(args[0] == "-m pip install -r " + (root.Path() / "repo" / "requirements.txt").string() +
                         " --target " + options.dependency_dir + " --upgrade");
    auto cwd = ReadLines(tools.Path() / "cwd.txt");
    REQUIRE(cwd.size() == 1);
    CHECK(fs::equivalent(cwd[0], root.Path() / "repo"));
}

TEST_CASE("InstallDependencies: failure is reported, not raised", "[provision]") {
    TempDir root;
    TempDir tools;
    WriteFile(root.Path() / "repo" / "requirements.txt", "does-not-exist==0.0\n");
    WriteRecordingInterpreter(tools.Path() / "python", 1);

    ProvisionOptions options;
    options.dependency_dir = (root.Path() / "deps").string();
    options.python_executable = (tools.Path() / "python").string();
    GithubProvisioner provisioner(options);

    auto failure = provisioner.InstallDependencies({root.Path(), root.Path() / "repo"},
                                                   Deadline::After(10s));
    REQUIRE(failure.has_value());
    CHECK(failure->kind == ErrorKind::DependencyInstallFailure);
    CHECK(failure->message.find("exited with code 1") != std::string::npos);
    REQUIRE(failure->detail.has_value());
    CHECK(failure->detail->find("no matching distribution") != std::string::npos);
}
