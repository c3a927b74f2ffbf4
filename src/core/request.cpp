#include "coroform/core/request.hpp"

#include <algorithm>
#include <cctype>

namespace coroform {

HttpMethod parse_method(std::string_view method) noexcept {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "DELETE") return HttpMethod::DELETE;
    if (method == "PATCH") return HttpMethod::PATCH;
    if (method == "HEAD") return HttpMethod::HEAD;
    if (method == "OPTIONS") return HttpMethod::OPTIONS;
    if (method == "CONNECT") return HttpMethod::CONNECT;
    if (method == "TRACE") return HttpMethod::TRACE;
    return HttpMethod::UNKNOWN;
}

std::string_view method_to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::CONNECT: return "CONNECT";
        case HttpMethod::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

bool is_submit_method(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::POST:
        case HttpMethod::PUT:
        case HttpMethod::PATCH:
        case HttpMethod::DELETE:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Header keys
// ============================================================================

size_t HeaderKeyHash::operator()(std::string_view key) const noexcept {
    // FNV-1a over the lower-cased bytes
    size_t hash = 14695981039346656037ULL;
    for (unsigned char c : key) {
        hash ^= static_cast<size_t>(std::tolower(c));
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool HeaderKeyEqual::operator()(std::string_view a, std::string_view b) const noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// ============================================================================
// Request
// ============================================================================

void Request::set_query_string(std::string qs) {
    query_string_ = std::move(qs);
    query_params_.clear();

    std::string_view rest = query_string_;
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        query_params_.emplace(std::move(key), std::move(value));
    }
}

std::string Request::media_type() const {
    auto ct = content_type();
    if (!ct) return {};

    auto type = ct->substr(0, ct->find(';'));
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.remove_suffix(1);
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front()))) {
        type.remove_prefix(1);
    }

    std::string out(type);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<Url> Request::url() const {
    auto host = header("Host");
    if (!host) return std::nullopt;

    auto url = parse_authority(scheme_, *host);
    if (!url) return std::nullopt;

    url->path = path_;
    url->query = query_string_;
    return url;
}

// ============================================================================
// URL encoding
// ============================================================================

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string url_encode(std::string_view s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace coroform
