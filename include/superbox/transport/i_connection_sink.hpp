#pragma once

#include <superbox/core/result.hpp>

#include <string_view>

namespace superbox {

// ---------------------------------------------------------------------------
// IConnectionSink: the outbound half of one client connection.
//
// Post delivers one complete message (no trailing newline). A failed post is
// a transport error; the bridge tears the session down.
// ---------------------------------------------------------------------------
class IConnectionSink {
public:
    virtual ~IConnectionSink() = default;

    IConnectionSink(const IConnectionSink&) = delete;
    IConnectionSink& operator=(const IConnectionSink&) = delete;
    IConnectionSink(IConnectionSink&&) = delete;
    IConnectionSink& operator=(IConnectionSink&&) = delete;

    [[nodiscard]] virtual Result<void, Error> Post(std::string_view message) = 0;

protected:
    IConnectionSink() = default;
};

} // namespace superbox
