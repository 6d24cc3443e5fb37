#pragma once

#include <superbox/bridge/protocol_bridge.hpp>

#include <iostream>
#include <string>

namespace superbox {

// ---------------------------------------------------------------------------
// StdioGateway: the bridge's own stdin/stdout as one persistent connection.
//
// Each non-empty input line is one client message; each outbound message is
// written as one line and flushed. EOF disconnects the session.
// ---------------------------------------------------------------------------
class StdioGateway {
public:
    static constexpr const char* kConnectionId = "stdio";

    StdioGateway(ProtocolBridge& bridge, ConnectionParams params,
                 std::istream& in = std::cin, std::ostream& out = std::cout);

    // Blocks until EOF on input or until output can no longer be written.
    void Run();

private:
    ProtocolBridge& bridge_;
    ConnectionParams params_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace superbox
