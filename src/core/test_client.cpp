#include "coroform/core/test_client.hpp"

#include <cctype>
#include <stdexcept>

#include "coroform/core/url.hpp"
#include "coroform/util/from_string.hpp"

namespace coroform {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool is_absolute(std::string_view url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

std::string host_header(const Url& url) {
    std::string host = url.host;
    if (url.port) {
        host += ":" + std::to_string(*url.port);
    }
    return host;
}

constexpr std::string_view MULTIPART_BOUNDARY = "coroform-test-boundary-7MA4YWxkTrZu0gW";

} // anonymous namespace

// ============================================================================
// ClientCookieState
// ============================================================================

void ClientCookieState::apply(Request& req) const {
    if (cookies_.empty()) {
        return;
    }

    std::string cookie_header;
    for (const auto& [name, value] : cookies_) {
        if (!cookie_header.empty()) {
            cookie_header += "; ";
        }
        cookie_header += name + "=" + value;
    }
    req.add_header("Cookie", cookie_header);
}

void ClientCookieState::observe(const Response& resp) {
    for (auto value : resp.header_values("Set-Cookie")) {
        parse_set_cookie(value);
    }
}

std::optional<std::string> ClientCookieState::get_cookie(const std::string& name) const {
    auto it = cookies_.find(name);
    if (it != cookies_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ClientCookieState::parse_set_cookie(std::string_view header) {
    auto semi = header.find(';');
    auto name_value = header.substr(0, semi);

    auto eq = name_value.find('=');
    if (eq == std::string_view::npos) {
        return;
    }

    std::string name(trim(name_value.substr(0, eq)));
    std::string value(trim(name_value.substr(eq + 1)));
    if (name.empty()) {
        return;
    }

    bool expired = false;
    auto attributes = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);
    while (!attributes.empty()) {
        auto next = attributes.find(';');
        auto attribute = trim(attributes.substr(0, next));
        attributes = next == std::string_view::npos ? std::string_view{} : attributes.substr(next + 1);

        auto attr_eq = attribute.find('=');
        if (attr_eq == std::string_view::npos) continue;

        auto key = trim(attribute.substr(0, attr_eq));
        if (!HeaderKeyEqual{}(key, "Max-Age")) continue;

        auto max_age = from_string<long long>(trim(attribute.substr(attr_eq + 1)));
        if (max_age && *max_age <= 0) {
            expired = true;
        }
    }

    if (expired) {
        cookies_.erase(name);
    } else {
        cookies_[std::move(name)] = std::move(value);
    }
}

// ============================================================================
// TestClient
// ============================================================================

TestClient::TestClient(App& app, std::string base_url)
    : app_(app)
    , base_url_(std::move(base_url))
{
    if (!parse_url(base_url_)) {
        throw std::invalid_argument("TestClient base URL is not absolute: " + base_url_);
    }
}

Request TestClient::build_request(HttpMethod method, std::string_view url,
                                  std::string body, const Headers& headers) const {
    std::optional<Url> target;
    if (is_absolute(url)) {
        target = parse_url(url);
        if (!target) {
            throw std::invalid_argument("TestClient cannot parse URL: " + std::string(url));
        }
    } else {
        target = parse_url(base_url_);
        auto q = url.find('?');
        auto path = url.substr(0, q);
        target->path = path.empty() ? "/" : std::string(path);
        target->query = q == std::string_view::npos ? std::string{} : std::string(url.substr(q + 1));
    }

    Request req;
    req.set_method(method);
    req.set_scheme(target->scheme);
    req.set_path(target->path);
    req.set_query_string(target->query);
    req.add_header("Host", host_header(*target));
    if (!body.empty()) {
        req.add_header("Content-Length", std::to_string(body.size()));
    }
    req.set_body(std::move(body));

    cookies_.apply(req);

    for (const auto& [key, value] : headers) {
        req.add_header(key, value);
    }
    return req;
}

Response TestClient::request(HttpMethod method, std::string_view url,
                             std::string body, const Headers& headers) {
    auto req = build_request(method, url, std::move(body), headers);
    auto resp = app_.dispatch(req).sync_wait();
    cookies_.observe(resp);
    return resp;
}

Response TestClient::submit_form(HttpMethod method, std::string_view url,
                                 const FormData& data, const Headers& headers) {
    Headers all{{"Content-Type", "application/x-www-form-urlencoded"}};
    all.insert(all.end(), headers.begin(), headers.end());
    return request(method, url, encode_urlencoded(data), all);
}

Response TestClient::post_multipart(std::string_view url, const FormData& data, const Headers& headers) {
    Headers all{{"Content-Type", "multipart/form-data; boundary=" + std::string(MULTIPART_BOUNDARY)}};
    all.insert(all.end(), headers.begin(), headers.end());
    return request(HttpMethod::POST, url, encode_multipart(data, MULTIPART_BOUNDARY), all);
}

Response TestClient::post_json(std::string_view url, const nlohmann::json& body, const Headers& headers) {
    Headers all{{"Content-Type", "application/json"}};
    all.insert(all.end(), headers.begin(), headers.end());
    return request(HttpMethod::POST, url, body.dump(), all);
}

// ============================================================================
// Body encoders
// ============================================================================

std::string encode_urlencoded(const FormData& data) {
    std::string out;
    for (const auto& field : data.fields()) {
        if (!out.empty()) {
            out += '&';
        }
        out += url_encode(field.name);
        out += '=';
        out += url_encode(field.value);
    }
    return out;
}

std::string encode_multipart(const FormData& data, std::string_view boundary) {
    std::string out;
    for (const auto& field : data.fields()) {
        out += "--";
        out += boundary;
        out += "\r\nContent-Disposition: form-data; name=\"";
        out += field.name;
        out += '"';
        if (field.is_file) {
            out += "; filename=\"";
            out += field.filename;
            out += '"';
        }
        out += "\r\n";
        if (!field.content_type.empty()) {
            out += "Content-Type: ";
            out += field.content_type;
            out += "\r\n";
        }
        out += "\r\n";
        out += field.value;
        out += "\r\n";
    }
    out += "--";
    out += boundary;
    out += "--\r\n";
    return out;
}

} // namespace coroform
