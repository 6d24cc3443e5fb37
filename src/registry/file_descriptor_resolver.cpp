#include <superbox/registry/file_descriptor_resolver.hpp>

#include <superbox/core/log.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace superbox {

FileDescriptorResolver::FileDescriptorResolver(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

Result<Descriptor, Error> FileDescriptorResolver::Resolve(const ServerName& name) {
    const auto key = name.Value() + ".json";
    const auto path = directory_ / key;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return Result<Descriptor, Error>::Err(Error::Make(ErrorKind::StoreError, "Resolve",
                "Cannot access " + path.string() + ": " + ec.message()));
        }
        return Result<Descriptor, Error>::Err(Error::Make(ErrorKind::NotFound, "Resolve",
            "MCP definition not found: " + key));
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Descriptor, Error>::Err(Error::Make(ErrorKind::StoreError, "Resolve",
            "Cannot read " + path.string()));
    }
    std::ostringstream body;
    body << in.rdbuf();
    LogDebug("resolver", "Loaded " + path.string());
    return ParseDescriptor(body.str(), key);
}

} // namespace superbox
