#include <superbox/provision/github_provisioner.hpp>

#include <superbox/core/log.hpp>
#include <superbox/process/child_process.hpp>

#include <httplib.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace superbox {

namespace {

namespace fs = std::filesystem;

Error MakeProvisionError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorKind::ProvisionError, operation, message);
}

bool IsRepoSegment(std::string_view segment) {
    if (segment.empty() || segment == "." || segment == "..") {
        return false;
    }
    return std::all_of(segment.begin(), segment.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    });
}

bool EndsWith(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "https://host[:port]/path" -> {"https://host[:port]", "/path"}
std::pair<std::string, std::string> SplitUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    auto path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

} // anonymous namespace

Result<std::string, Error> ResolveArchiveUrl(const std::string& repository_url,
                                             const std::string& branch,
                                             const std::string& archive_base) {
    auto unsupported = [&repository_url]() {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorKind::UnsupportedSource, "Materialize",
            "Only GitHub repositories are supported: " + repository_url));
    };

    std::string rest;
    for (const char* prefix : {"https://github.com/", "http://github.com/",
                               "https://www.github.com/", "http://www.github.com/"}) {
        std::string_view p(prefix);
        if (repository_url.compare(0, p.size(), p) == 0) {
            rest = repository_url.substr(p.size());
            break;
        }
    }
    if (rest.empty()) {
        return unsupported();
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (EndsWith(rest, ".git")) {
        rest.resize(rest.size() - 4);
    }

    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        return unsupported();
    }
    auto owner = rest.substr(0, slash);
    auto repo = rest.substr(slash + 1);
    if (!IsRepoSegment(owner) || !IsRepoSegment(repo)) {
        return unsupported();
    }

    return Result<std::string, Error>::Ok(
        archive_base + "/" + owner + "/" + repo + "/archive/refs/heads/" + branch + ".zip");
}

Result<void, Error> FlattenInto(const fs::path& extracted, const fs::path& target) {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(extracted, ec)) {
        entries.push_back(entry.path());
    }
    if (ec) {
        return Result<void, Error>::Err(MakeProvisionError("Extract",
            "Cannot list " + extracted.string() + ": " + ec.message()));
    }
    if (entries.empty()) {
        return Result<void, Error>::Err(MakeProvisionError("Extract", "Archive is empty"));
    }

    if (entries.size() == 1 && fs::is_directory(entries.front(), ec)) {
        fs::rename(entries.front(), target, ec);
        if (ec) {
            return Result<void, Error>::Err(MakeProvisionError("Extract",
                "Cannot move " + entries.front().string() + ": " + ec.message()));
        }
        return Result<void, Error>::Ok();
    }

    fs::create_directories(target, ec);
    if (ec) {
        return Result<void, Error>::Err(MakeProvisionError("Extract",
            "Cannot create " + target.string() + ": " + ec.message()));
    }
    for (const auto& entry : entries) {
        fs::rename(entry, target / entry.filename(), ec);
        if (ec) {
            return Result<void, Error>::Err(MakeProvisionError("Extract",
                "Cannot move " + entry.string() + ": " + ec.message()));
        }
    }
    return Result<void, Error>::Ok();
}

GithubProvisioner::GithubProvisioner(ProvisionOptions options)
    : options_(std::move(options)) {}

Result<Workspace, Error> GithubProvisioner::Materialize(const std::string& repository_url,
                                                        const ServerName& name,
                                                        const Deadline& deadline) {
    auto archive_url = ResolveArchiveUrl(repository_url, options_.branch, options_.archive_base);
    if (archive_url.IsErr()) {
        return Result<Workspace, Error>::Err(std::move(archive_url).Error());
    }

    auto root = MakeTempDirectory(options_.workspace_root, "mcp_" + name.Value() + "_");
    if (root.IsErr()) {
        return Result<Workspace, Error>::Err(std::move(root).Error());
    }

    Workspace workspace;
    workspace.root = std::move(root).Value();
    workspace.path = workspace.root / "repo";
    LogInfo("provision", "Fetching " + archive_url.Value() + " into " + workspace.root.string());

    auto archive = workspace.root / "repo.zip";
    auto result = Download(archive_url.Value(), archive, deadline);
    if (result.IsOk()) {
        result = Extract(archive, workspace.root, deadline);
    }
    if (result.IsOk()) {
        result = FlattenInto(workspace.root / "extract", workspace.path);
    }
    if (result.IsErr()) {
        RemoveWorkspace(workspace);
        return Result<Workspace, Error>::Err(std::move(result).Error());
    }

    std::error_code ec;
    fs::remove(archive, ec);
    fs::remove_all(workspace.root / "extract", ec);
    LogDebug("provision", "Workspace ready at " + workspace.path.string());
    return Result<Workspace, Error>::Ok(std::move(workspace));
}

Result<void, Error> GithubProvisioner::Download(const std::string& url,
                                                const fs::path& target,
                                                const Deadline& deadline) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(MakeProvisionError("Download",
            "Cannot write " + target.string()));
    }

    auto [origin, path] = SplitUrl(url);
    auto timeout = deadline.Remaining(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.download_timeout));

    httplib::Client client(origin);
    client.set_follow_location(true);
    client.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout));
    client.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout));

    size_t received = 0;
    auto res = client.Get(path, [&](const char* data, size_t length) {
        out.write(data, static_cast<std::streamsize>(length));
        received += length;
        return static_cast<bool>(out) && !deadline.Expired();
    });
    out.close();

    if (deadline.Expired()) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::Timeout, "Download",
            "Deadline passed while downloading " + url));
    }
    if (!res) {
        return Result<void, Error>::Err(MakeProvisionError("Download",
            "Fetching " + url + " failed: " + httplib::to_string(res.error())));
    }
    if (res->status != 200) {
        return Result<void, Error>::Err(MakeProvisionError("Download",
            "Fetching " + url + " returned HTTP " + std::to_string(res->status)));
    }
    if (received == 0) {
        return Result<void, Error>::Err(MakeProvisionError("Download",
            "Archive from " + url + " is empty"));
    }
    LogDebug("provision", "Downloaded " + std::to_string(received) + " bytes");
    return Result<void, Error>::Ok();
}

Result<void, Error> GithubProvisioner::Extract(const fs::path& archive,
                                               const fs::path& root,
                                               const Deadline& deadline) {
    SpawnOptions unzip;
    unzip.argv = {options_.unzip_executable, "-q", "-o", archive.string(),
                  "-d", (root / "extract").string()};

    auto run = RunCommand(unzip, deadline);
    if (run.IsErr()) {
        auto error = std::move(run).Error();
        if (error.kind != ErrorKind::Timeout) {
            error.kind = ErrorKind::ProvisionError;
        }
        return Result<void, Error>::Err(std::move(error));
    }

    // unzip exits 1 for warnings; the files are still there.
    const auto& status = run.Value().status;
    if (status.signaled || status.code > 1) {
        auto error = MakeProvisionError("Extract", "unzip " + status.Describe());
        if (!run.Value().stderr_text.empty()) {
            error.detail = Truncate(run.Value().stderr_text, 500);
        }
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

std::optional<Error> GithubProvisioner::InstallDependencies(const Workspace& workspace,
                                                            const Deadline& deadline) {
    auto requirements = workspace.path / "requirements.txt";
    std::error_code ec;
    if (!fs::exists(requirements, ec)) {
        return std::nullopt;
    }

    fs::create_directories(options_.dependency_dir, ec);
    if (ec) {
        return Error::Make(ErrorKind::DependencyInstallFailure, "InstallDependencies",
            "Cannot create " + options_.dependency_dir + ": " + ec.message());
    }

    LogInfo("provision", "Installing dependencies to " + options_.dependency_dir);
    SpawnOptions pip;
    pip.argv = {options_.python_executable, "-m", "pip", "install",
                "-r", requirements.string(),
                "--target", options_.dependency_dir, "--upgrade"};
    pip.working_directory = workspace.path.string();

    auto run = RunCommand(pip, deadline.Cap(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.install_timeout)));
    if (run.IsErr()) {
        auto error = std::move(run).Error();
        error.kind = ErrorKind::DependencyInstallFailure;
        error.operation = "InstallDependencies";
        return error;
    }
    if (!run.Value().status.Success()) {
        auto error = Error::Make(ErrorKind::DependencyInstallFailure, "InstallDependencies",
            "pip " + run.Value().status.Describe());
        error.detail = Truncate(run.Value().stderr_text, 500);
        return error;
    }
    LogInfo("provision", "Dependencies installed");
    return std::nullopt;
}

} // namespace superbox
