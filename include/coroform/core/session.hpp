#pragma once

#include <any>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "coroform/core/app.hpp"
#include "coroform/core/cookie.hpp"
#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"
#include "coroform/coro/task.hpp"

namespace coroform {

// ============================================================================
// Session Data
// ============================================================================

class Session {
    std::string id_;
    std::unordered_map<std::string, std::any> data_;
    std::chrono::system_clock::time_point created_;
    std::chrono::system_clock::time_point last_accessed_;
    bool modified_ = false;
    bool is_new_ = false;

public:
    Session() = default;
    explicit Session(std::string id, bool is_new = false);

    const std::string& id() const { return id_; }

    // Created during this request
    bool is_new() const { return is_new_; }

    bool is_modified() const { return modified_; }

    std::chrono::system_clock::time_point created_at() const { return created_; }
    std::chrono::system_clock::time_point last_accessed_at() const { return last_accessed_; }

    // nullopt when absent or holding another type
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        if (auto* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    template<typename T>
    T get_or(const std::string& key, T default_value) const {
        return get<T>(key).value_or(std::move(default_value));
    }

    template<typename T>
    void set(const std::string& key, T value) {
        data_[key] = std::move(value);
        modified_ = true;
    }

    void remove(const std::string& key);
    bool has(const std::string& key) const;
    void clear();
    std::vector<std::string> keys() const;

    void touch();

    void mark_saved() {
        modified_ = false;
        is_new_ = false;
    }
};

// ============================================================================
// Session Store Interface
// ============================================================================

class SessionStore {
public:
    virtual ~SessionStore() = default;

    // nullptr if unknown or expired
    virtual std::shared_ptr<Session> load(const std::string& id) = 0;

    virtual void save(const Session& session) = 0;
    virtual void destroy(const std::string& id) = 0;
    virtual std::string generate_id() = 0;
};

// ============================================================================
// In-Memory Session Store
// ============================================================================

class MemorySessionStore : public SessionStore {
    struct StoredSession {
        std::shared_ptr<Session> session;
        std::chrono::system_clock::time_point expires;
    };

    std::unordered_map<std::string, StoredSession> sessions_;
    mutable std::mutex mutex_;
    std::chrono::seconds default_max_age_{3600};

public:
    MemorySessionStore() = default;
    explicit MemorySessionStore(std::chrono::seconds max_age) : default_max_age_(max_age) {}

    // Returns a copy; changes reach the store through save()
    std::shared_ptr<Session> load(const std::string& id) override;

    // Also drops every other session that has expired
    void save(const Session& session) override;
    void destroy(const std::string& id) override;

    // 128 random bits from OpenSSL, hex encoded
    std::string generate_id() override;

    size_t size() const;

private:
    void evict_expired(std::chrono::system_clock::time_point now);
};

// ============================================================================
// Session Options
// ============================================================================

struct SessionOptions {
    std::string cookie_name = "session";
    std::string cookie_path = "/";
    std::string cookie_domain;
    std::chrono::seconds max_age{14 * 24 * 3600};

    bool secure = false;
    bool http_only = true;
    SameSite same_site = SameSite::Lax;
};

// ============================================================================
// Session Middleware
// ============================================================================

class SessionMiddleware {
    std::shared_ptr<SessionStore> store_;
    SessionOptions options_;

public:
    SessionMiddleware(std::shared_ptr<SessionStore> store, SessionOptions options = {});

    Task<Response> operator()(Request& req, Next next);

    // nullptr when the middleware did not run for this request
    static std::shared_ptr<Session> get_session(const Request& req);

private:
    Cookie create_session_cookie(const std::string& session_id) const;
};

// ============================================================================
// Middleware Factory
// ============================================================================

Middleware sessions(SessionOptions options = {});
Middleware sessions(std::shared_ptr<SessionStore> store, SessionOptions options = {});

inline std::shared_ptr<Session> session(const Request& req) {
    return SessionMiddleware::get_session(req);
}

} // namespace coroform
