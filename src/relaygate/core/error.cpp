#include "relaygate/core/error.hpp"

namespace relaygate {

std::string_view to_string(Errc c) noexcept {
    switch (c) {
        case Errc::UnknownNode:              return "unknown_node";
        case Errc::UnknownProject:           return "unknown_project";
        case Errc::InvalidSegment:           return "invalid_segment";
        case Errc::InvalidAddress:           return "invalid_address";
        case Errc::RemoteRefreshFailed:      return "remote_refresh_failed";
        case Errc::TransportUnavailable:     return "transport_unavailable";
        case Errc::AuthorizationCheckFailed: return "authorization_check_failed";
        case Errc::InvalidConfig:            return "invalid_config";
    }
    return "unknown";
}

} // namespace relaygate
