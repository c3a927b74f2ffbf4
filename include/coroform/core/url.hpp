#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace coroform {

// ============================================================================
// Url - the parts of an absolute URL that origin checks care about
// ============================================================================

struct Url {
    std::string scheme;                 // lower-cased
    std::string host;                   // as written, without port
    std::optional<uint16_t> port;       // only when explicitly given
    std::string path = "/";
    std::string query;

    // Lower-cased host, brackets kept for IPv6 literals
    std::string hostname() const;

    bool secure() const noexcept { return scheme == "https"; }
};

// Parse "scheme://host[:port][/path][?query]". Returns nullopt when there is
// no scheme, no host, or the port is not a number in range.
std::optional<Url> parse_url(std::string_view text);

// Split a Host header value into host and optional port
std::optional<Url> parse_authority(std::string_view scheme, std::string_view authority);

} // namespace coroform
