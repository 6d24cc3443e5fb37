#pragma once

#include <superbox/core/deadline.hpp>
#include <superbox/core/result.hpp>
#include <superbox/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace superbox {

// ---------------------------------------------------------------------------
// Workspace: a materialized source tree owned by one session.
//
// `root` is the unique temp directory; `path` (normally root/repo) holds the
// flattened repository. Removing `root` removes everything.
// ---------------------------------------------------------------------------
struct Workspace {
    std::filesystem::path root;
    std::filesystem::path path;
};

// ---------------------------------------------------------------------------
// IWorkspaceProvisioner: fetch a repository into a fresh workspace and
// install its declared dependencies.
//
// Materialize leaves nothing behind on failure. InstallDependencies never
// fails the caller: it returns the DependencyInstallFailure to log, if any.
// ---------------------------------------------------------------------------
class IWorkspaceProvisioner {
public:
    virtual ~IWorkspaceProvisioner() = default;

    IWorkspaceProvisioner(const IWorkspaceProvisioner&) = delete;
    IWorkspaceProvisioner& operator=(const IWorkspaceProvisioner&) = delete;
    IWorkspaceProvisioner(IWorkspaceProvisioner&&) = delete;
    IWorkspaceProvisioner& operator=(IWorkspaceProvisioner&&) = delete;

    [[nodiscard]] virtual Result<Workspace, Error> Materialize(
        const std::string& repository_url, const ServerName& name,
        const Deadline& deadline) = 0;

    [[nodiscard]] virtual std::optional<Error> InstallDependencies(
        const Workspace& workspace, const Deadline& deadline) = 0;

protected:
    IWorkspaceProvisioner() = default;
};

// Remove a workspace root and everything below it. Logs, never fails.
void RemoveWorkspace(const Workspace& workspace);

// Create <parent>/<prefix>XXXXXX with mkdtemp(3).
[[nodiscard]] Result<std::filesystem::path, Error> MakeTempDirectory(
    const std::filesystem::path& parent, const std::string& prefix);

} // namespace superbox
