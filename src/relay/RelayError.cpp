#include "fwdproxy/relay/RelayError.h"

namespace fwdproxy {
namespace relay {

const char* ConnectErrorName(ConnectError e) {
    switch (e) {
        case ConnectError::kNone: return "None";
        case ConnectError::kDnsFailure: return "DnsFailure";
        case ConnectError::kConnectTimeout: return "ConnectTimeout";
        case ConnectError::kConnectionRefused: return "ConnectionRefused";
    }
    return "Unknown";
}

const char* RelayErrorName(RelayError e) {
    switch (e) {
        case RelayError::kNone: return "None";
        case RelayError::kUpstreamClosed: return "UpstreamClosed";
        case RelayError::kClientClosed: return "ClientClosed";
        case RelayError::kIdleTimeout: return "IdleTimeout";
        case RelayError::kIoError: return "IoError";
    }
    return "Unknown";
}

} // namespace relay
} // namespace fwdproxy
