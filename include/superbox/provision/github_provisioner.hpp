#pragma once

#include <superbox/provision/i_workspace_provisioner.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace superbox {

struct ProvisionOptions {
    std::filesystem::path workspace_root;     // empty: the system temp directory
    std::string dependency_dir = "/tmp/pip_modules";
    std::string python_executable = "python3";
    std::string unzip_executable = "unzip";
    std::string branch = "main";
    std::string archive_base = "https://github.com"; // scheme://host[:port], no trailing '/'
    std::chrono::seconds download_timeout{120};
    std::chrono::seconds install_timeout{180};
};

// https://github.com/<owner>/<repo>[.git][/] ->
//   <archive_base>/<owner>/<repo>/archive/refs/heads/<branch>.zip
// UnsupportedSource for anything that is not a GitHub repository URL.
[[nodiscard]] Result<std::string, Error> ResolveArchiveUrl(
    const std::string& repository_url, const std::string& branch,
    const std::string& archive_base = "https://github.com");

// ---------------------------------------------------------------------------
// GithubProvisioner: downloads a branch archive with cpp-httplib, extracts
// it with unzip(1) and installs requirements.txt with pip --target.
// ---------------------------------------------------------------------------
class GithubProvisioner : public IWorkspaceProvisioner {
public:
    explicit GithubProvisioner(ProvisionOptions options);

    [[nodiscard]] Result<Workspace, Error> Materialize(
        const std::string& repository_url, const ServerName& name,
        const Deadline& deadline) override;

    [[nodiscard]] std::optional<Error> InstallDependencies(
        const Workspace& workspace, const Deadline& deadline) override;

    [[nodiscard]] const ProvisionOptions& Options() const noexcept { return options_; }

private:
    [[nodiscard]] Result<void, Error> Download(const std::string& url,
                                               const std::filesystem::path& target,
                                               const Deadline& deadline);
    [[nodiscard]] Result<void, Error> Extract(const std::filesystem::path& archive,
                                              const std::filesystem::path& root,
                                              const Deadline& deadline);

    ProvisionOptions options_;
};

// Move the contents of `extracted` to `target`: when `extracted` holds exactly
// one directory, that directory's contents; otherwise everything.
// ProvisionError when `extracted` is empty.
[[nodiscard]] Result<void, Error> FlattenInto(const std::filesystem::path& extracted,
                                              const std::filesystem::path& target);

} // namespace superbox
