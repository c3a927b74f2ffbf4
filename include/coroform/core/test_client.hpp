#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "coroform/core/app.hpp"
#include "coroform/core/form_data.hpp"
#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"

namespace coroform {

// ============================================================================
// ClientCookieState - cookies a client keeps between requests
// ============================================================================

class ClientCookieState {
    std::unordered_map<std::string, std::string> cookies_;

public:
    // Add the stored cookies to an outgoing request
    void apply(Request& req) const;

    // Learn from Set-Cookie headers. A Max-Age of zero or less drops the
    // cookie.
    void observe(const Response& resp);

    void set_cookie(const std::string& name, const std::string& value) {
        cookies_[name] = value;
    }

    std::optional<std::string> get_cookie(const std::string& name) const;

    void remove_cookie(const std::string& name) { cookies_.erase(name); }

    const std::unordered_map<std::string, std::string>& cookies() const {
        return cookies_;
    }

    void clear() { cookies_.clear(); }

private:
    void parse_set_cookie(std::string_view header);
};

// ============================================================================
// TestClient - drives an App in-process
// ============================================================================

// Requests run to completion on the calling thread. Handlers that suspend on
// something that never resumes make the call throw std::logic_error.
//
//   TestClient client(app);
//   auto page = client.get("/signup");
//   auto resp = client.post_form("/signup", {{"email", "a@example.com"}});
class TestClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

private:
    App& app_;
    std::string base_url_;
    ClientCookieState cookies_;

public:
    // Relative URLs resolve against base_url
    explicit TestClient(App& app, std::string base_url = "http://testserver");

    // url is a path with optional query ("/items?page=2") or an absolute URL
    Response request(HttpMethod method, std::string_view url,
                     std::string body = {}, const Headers& headers = {});

    Response get(std::string_view url, const Headers& headers = {}) {
        return request(HttpMethod::GET, url, {}, headers);
    }

    // application/x-www-form-urlencoded
    Response submit_form(HttpMethod method, std::string_view url,
                         const FormData& data, const Headers& headers = {});

    Response post_form(std::string_view url, const FormData& data, const Headers& headers = {}) {
        return submit_form(HttpMethod::POST, url, data, headers);
    }

    // multipart/form-data; fields with is_file set are sent as uploads
    Response post_multipart(std::string_view url, const FormData& data, const Headers& headers = {});

    // application/json
    Response post_json(std::string_view url, const nlohmann::json& body, const Headers& headers = {});

    ClientCookieState& cookies() noexcept { return cookies_; }
    const ClientCookieState& cookies() const noexcept { return cookies_; }

    const std::string& base_url() const noexcept { return base_url_; }

    // Builds the request a call would send without dispatching it
    Request build_request(HttpMethod method, std::string_view url,
                          std::string body = {}, const Headers& headers = {}) const;
};

// Encoders used by the client, exposed for tests that build bodies by hand
std::string encode_urlencoded(const FormData& data);
std::string encode_multipart(const FormData& data, std::string_view boundary);

} // namespace coroform
