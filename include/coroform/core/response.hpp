#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace coroform {

class Error;

// ============================================================================
// Response
// ============================================================================

class Response {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    int status_ = 200;
    std::string status_text_ = "OK";
    Headers headers_;
    std::string body_;

public:
    Response() = default;

    Response(int status, Headers headers, std::string body)
        : status_(status)
        , status_text_(default_status_text(status))
        , headers_(std::move(headers))
        , body_(std::move(body)) {}

    // Accessors
    int status() const noexcept { return status_; }
    std::string_view status_text() const noexcept { return status_text_; }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    // First header with this name, compared case-insensitively
    std::optional<std::string_view> header(std::string_view key) const;

    // Every value of a repeated header (Set-Cookie)
    std::vector<std::string_view> header_values(std::string_view key) const;

    void set_header(std::string key, std::string value);

    // Add header (allows duplicates, needed for Set-Cookie)
    void add_header(std::string key, std::string value) {
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void set_status(int status) {
        status_ = status;
        status_text_ = default_status_text(status);
    }

    void set_body(std::string body) {
        body_ = std::move(body);
    }

    // Serialize to HTTP response string
    std::string serialize() const;

    static Response text(int status, std::string body, std::string content_type = "text/plain");

    static Response ok(std::string body = "", std::string content_type = "text/plain") {
        return text(200, std::move(body), std::move(content_type));
    }

    static Response json(std::string body) {
        return ok(std::move(body), "application/json");
    }

    static Response html(std::string body) {
        return ok(std::move(body), "text/html; charset=utf-8");
    }

    static Response bad_request(std::string body = "Bad Request") {
        return text(400, std::move(body));
    }

    static Response forbidden(std::string body = "Forbidden") {
        return text(403, std::move(body));
    }

    static Response not_found(std::string body = "Not Found") {
        return text(404, std::move(body));
    }

    static Response method_not_allowed(std::string body = "Method Not Allowed") {
        return text(405, std::move(body));
    }

    static Response redirect(std::string location, int status = 303) {
        Response r;
        r.set_status(status);
        r.headers_.emplace_back("Location", std::move(location));
        r.headers_.emplace_back("Content-Length", "0");
        return r;
    }

private:
    static std::string_view default_status_text(int status) noexcept;
};

// Plain-text response whose status comes from the error and whose body is
// exactly the error message (the status text when the message is empty)
Response error_response(const Error& error);

} // namespace coroform
