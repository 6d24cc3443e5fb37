#pragma once

#include <superbox/registry/i_descriptor_resolver.hpp>

#include <filesystem>

namespace superbox {

// Descriptors stored as <directory>/<name>.json on local disk.
class FileDescriptorResolver : public IDescriptorResolver {
public:
    explicit FileDescriptorResolver(std::filesystem::path directory);

    [[nodiscard]] Result<Descriptor, Error> Resolve(const ServerName& name) override;

private:
    std::filesystem::path directory_;
};

} // namespace superbox
