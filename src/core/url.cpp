#include "coroform/core/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace coroform {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<uint16_t> parse_port(std::string_view s) {
    if (s.empty()) return std::nullopt;
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

std::string Url::hostname() const {
    return to_lower(host);
}

std::optional<Url> parse_authority(std::string_view scheme, std::string_view authority) {
    // Drop userinfo
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    if (authority.empty()) return std::nullopt;

    Url url;
    url.scheme = to_lower(scheme);

    std::string_view host = authority;
    std::string_view port;

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(0, close + 1);
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            port = rest.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) return std::nullopt;
    url.host = std::string(host);

    // "host:" is treated like no port at all
    if (!port.empty()) {
        url.port = parse_port(port);
        if (!url.port) return std::nullopt;
    }
    return url;
}

std::optional<Url> parse_url(std::string_view text) {
    auto sep = text.find("://");
    if (sep == std::string_view::npos || sep == 0) return std::nullopt;

    auto scheme = text.substr(0, sep);
    auto rest = text.substr(sep + 3);

    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);

    auto url = parse_authority(scheme, authority);
    if (!url) return std::nullopt;

    if (authority_end != std::string_view::npos) {
        auto tail = rest.substr(authority_end);
        if (auto hash = tail.find('#'); hash != std::string_view::npos) {
            tail = tail.substr(0, hash);
        }
        auto q = tail.find('?');
        auto path = tail.substr(0, q);
        url->path = path.empty() ? "/" : std::string(path);
        if (q != std::string_view::npos) {
            url->query = std::string(tail.substr(q + 1));
        }
    }
    return url;
}

} // namespace coroform
