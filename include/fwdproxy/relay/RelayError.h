#pragma once

namespace fwdproxy {
namespace relay {

enum class ConnectError {
    kNone,
    kDnsFailure,
    kConnectTimeout,
    kConnectionRefused,
};

enum class RelayError {
    kNone,
    kUpstreamClosed, // upstream ended before a complete response
    kClientClosed,   // client went away mid-transfer
    kIdleTimeout,
    kIoError,
};

const char* ConnectErrorName(ConnectError e);
const char* RelayErrorName(RelayError e);

} // namespace relay
} // namespace fwdproxy
