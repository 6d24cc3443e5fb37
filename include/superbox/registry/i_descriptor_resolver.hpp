#pragma once

#include <superbox/core/result.hpp>
#include <superbox/core/types.hpp>
#include <superbox/registry/descriptor.hpp>

namespace superbox {

// ---------------------------------------------------------------------------
// IDescriptorResolver: looks up a server's Descriptor by name.
//
// NotFound when the store has no entry for the name; StoreError for every
// other lookup failure (transport, permissions, malformed value). Callers
// never retry. Implementations must be safe to call from several sessions
// at once.
// ---------------------------------------------------------------------------
class IDescriptorResolver {
public:
    virtual ~IDescriptorResolver() = default;

    IDescriptorResolver(const IDescriptorResolver&) = delete;
    IDescriptorResolver& operator=(const IDescriptorResolver&) = delete;
    IDescriptorResolver(IDescriptorResolver&&) = delete;
    IDescriptorResolver& operator=(IDescriptorResolver&&) = delete;

    [[nodiscard]] virtual Result<Descriptor, Error> Resolve(const ServerName& name) = 0;

protected:
    IDescriptorResolver() = default;
};

} // namespace superbox
