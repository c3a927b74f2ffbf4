#include "coroform/core/session.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "coroform/csrf/signer.hpp"

namespace coroform {

// ============================================================================
// Session Implementation
// ============================================================================

Session::Session(std::string id, bool is_new)
    : id_(std::move(id))
    , created_(std::chrono::system_clock::now())
    , last_accessed_(created_)
    , is_new_(is_new)
{}

void Session::remove(const std::string& key) {
    if (data_.erase(key) > 0) {
        modified_ = true;
    }
}

bool Session::has(const std::string& key) const {
    return data_.count(key) > 0;
}

void Session::clear() {
    if (!data_.empty()) {
        data_.clear();
        modified_ = true;
    }
}

std::vector<std::string> Session::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [key, _] : data_) {
        result.push_back(key);
    }
    return result;
}

void Session::touch() {
    last_accessed_ = std::chrono::system_clock::now();
}

// ============================================================================
// MemorySessionStore Implementation
// ============================================================================

std::shared_ptr<Session> MemorySessionStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }

    if (it->second.expires < std::chrono::system_clock::now()) {
        sessions_.erase(it);
        return nullptr;
    }

    it->second.session->touch();
    return std::make_shared<Session>(*it->second.session);
}

void MemorySessionStore::save(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    evict_expired(now);

    auto& stored = sessions_[session.id()];
    stored.session = std::make_shared<Session>(session);
    stored.session->mark_saved();
    stored.expires = now + default_max_age_;
}

void MemorySessionStore::destroy(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(id);
}

std::string MemorySessionStore::generate_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a session id");
    }

    return signing::hex_encode(std::string_view(reinterpret_cast<const char*>(bytes), sizeof(bytes)));
}

size_t MemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// Caller holds mutex_
void MemorySessionStore::evict_expired(std::chrono::system_clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (it->second.expires < now) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// SessionMiddleware Implementation
// ============================================================================

namespace {

const std::string SESSION_KEY = "__coroform_session";

} // anonymous namespace

SessionMiddleware::SessionMiddleware(std::shared_ptr<SessionStore> store, SessionOptions options)
    : store_(std::move(store))
    , options_(std::move(options))
{}

Cookie SessionMiddleware::create_session_cookie(const std::string& session_id) const {
    Cookie c;
    c.name = options_.cookie_name;
    c.value = session_id;
    c.path = options_.cookie_path;
    if (!options_.cookie_domain.empty()) {
        c.domain = options_.cookie_domain;
    }
    c.max_age = options_.max_age;
    c.secure = options_.secure;
    c.http_only = options_.http_only;
    c.same_site = options_.same_site;
    return c;
}

Task<Response> SessionMiddleware::operator()(Request& req, Next next) {
    auto jar = cookies(req);
    auto session_id = jar.get(options_.cookie_name);

    std::shared_ptr<Session> sess;
    if (session_id) {
        sess = store_->load(std::string(*session_id));
    }
    if (!sess) {
        sess = std::make_shared<Session>(store_->generate_id(), true);
    }

    req.set_context(SESSION_KEY, sess);

    Response resp = co_await next(req);

    // Empty new sessions are never stored nor sent
    if (sess->is_modified()) {
        bool send_cookie = sess->is_new();
        store_->save(*sess);
        if (send_cookie) {
            set_cookie(resp, create_session_cookie(sess->id()));
        }
    }

    co_return resp;
}

std::shared_ptr<Session> SessionMiddleware::get_session(const Request& req) {
    auto ctx = req.get_context<std::shared_ptr<Session>>(SESSION_KEY);
    return ctx.value_or(nullptr);
}

// ============================================================================
// Middleware Factory
// ============================================================================

Middleware sessions(SessionOptions options) {
    auto store = std::make_shared<MemorySessionStore>(options.max_age);
    return sessions(std::move(store), std::move(options));
}

Middleware sessions(std::shared_ptr<SessionStore> store, SessionOptions options) {
    auto middleware = std::make_shared<SessionMiddleware>(std::move(store), std::move(options));

    return [middleware](Request& req, Next next) -> Task<Response> {
        co_return co_await (*middleware)(req, std::move(next));
    };
}

} // namespace coroform
