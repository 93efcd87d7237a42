#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every Beacon Link component.
 *
 * @details
 * Nothing in the link layer throws across its public API. Failures travel as
 * one of these codes (or a plain `bool`) and are rendered into log lines with
 * to_reason(), which yields the stable snake_case token used after `reason=`.
 *
 * | Code                 | Raised by                      | Caller reaction                 |
 * |----------------------|--------------------------------|---------------------------------|
 * | DiscoveryUnavailable | Session::initialize()          | fatal for the session           |
 * | PermissionDenied     | Session::initialize()          | re-request OS grants, retry     |
 * | BridgeInitFailure    | Session::initialize()          | retry; blocks all other calls   |
 * | NotInitialized       | any Session op before init     | call initialize() first         |
 * | ConnectionTimeout    | ConnectionNegotiator (Failed)  | restart discovery / reconnect   |
 * | ConnectionFailed     | ConnectionNegotiator (Failed)  | restart discovery / reconnect   |
 * | SocketWriteFailure   | MessageChannel::send()         | surfaced as `false`             |
 * | MalformedEnvelope    | decode_envelope()              | recovered as raw text           |
 */

#include <cstdint>

namespace beacon {

enum class Error : uint8_t {
  None = 0,
  DiscoveryUnavailable,
  PermissionDenied,
  BridgeInitFailure,
  NotInitialized,
  ConnectionTimeout,
  ConnectionFailed,
  SocketWriteFailure,
  MalformedEnvelope,
};

/// Stable, log-friendly token for an error code (e.g. "connection_timeout").
const char* to_reason(Error e);

} // namespace beacon
