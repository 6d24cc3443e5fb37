#include <superbox/provision/i_workspace_provisioner.hpp>

#include <superbox/core/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace superbox {

void RemoveWorkspace(const Workspace& workspace) {
    if (workspace.root.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(workspace.root, ec);
    if (ec) {
        LogWarn("provision", "Failed to remove " + workspace.root.string() + ": " + ec.message());
    } else {
        LogDebug("provision", "Removed " + workspace.root.string());
    }
}

Result<std::filesystem::path, Error> MakeTempDirectory(const std::filesystem::path& parent,
                                                       const std::string& prefix) {
    std::error_code ec;
    auto base = parent.empty() ? std::filesystem::temp_directory_path(ec) : parent;
    if (ec) {
        return Result<std::filesystem::path, Error>::Err(Error::Make(
            ErrorKind::ProvisionError, "Materialize",
            "No temp directory available: " + ec.message()));
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        return Result<std::filesystem::path, Error>::Err(Error::Make(
            ErrorKind::ProvisionError, "Materialize",
            "Cannot create " + base.string() + ": " + ec.message()));
    }

    auto pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return Result<std::filesystem::path, Error>::Err(Error::Make(
            ErrorKind::ProvisionError, "Materialize",
            "mkdtemp failed in " + base.string() + ": " + std::strerror(errno)));
    }
    return Result<std::filesystem::path, Error>::Ok(std::filesystem::path(buffer.data()));
}

} // namespace superbox
