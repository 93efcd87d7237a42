// ============================================================================
// errors.cpp - implementation for errors.hpp
// ============================================================================

#include "beacon/errors.hpp"

namespace beacon {

const char* to_reason(Error e) {
  switch (e) {
    case Error::None:                 return "none";
    case Error::DiscoveryUnavailable: return "discovery_unavailable";
    case Error::PermissionDenied:     return "permission_denied";
    case Error::BridgeInitFailure:    return "bridge_init_failure";
    case Error::NotInitialized:       return "not_initialized";
    case Error::ConnectionTimeout:    return "connection_timeout";
    case Error::ConnectionFailed:     return "connection_failed";
    case Error::SocketWriteFailure:   return "socket_write_failure";
    case Error::MalformedEnvelope:    return "malformed_envelope";
  }
  return "unknown";
}

} // namespace beacon
