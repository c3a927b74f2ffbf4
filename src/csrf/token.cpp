#include "coroform/csrf/token.hpp"

#include <array>
#include <stdexcept>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include "coroform/core/logging.hpp"

namespace coroform {

std::string new_session_token() {
    std::array<unsigned char, 64> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a CSRF session token");
    }

    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(random.data(), random.size(), digest.data());
    return signing::hex_encode(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

std::string generate_token(Session& session,
                           CsrfState& state,
                           const Secret& secret,
                           std::string_view field_name,
                           Clock clock) {
    std::string key(field_name);

    if (auto cached = state.signed_tokens.find(key); cached != state.signed_tokens.end()) {
        return cached->second;
    }

    // A value of another type under the key is replaced like a missing one
    auto session_token = session.get<std::string>(key);
    if (!session_token) {
        session_token = new_session_token();
        session.set(key, *session_token);

        auto entry = default_logger().entry(LogLevel::Debug, "issued CSRF session token");
        entry.field("field", key);
        entry.field("session_new", session.is_new());
        default_logger().log(entry);
    }

    UrlSafeTimedSerializer serializer(secret, CSRF_TOKEN_SALT, std::move(clock));
    auto signed_token = serializer.dumps(*session_token);

    state.signed_tokens.emplace(std::move(key), signed_token);
    return signed_token;
}

expected<void, Error> validate_token(const Session& session,
                                     std::string_view candidate,
                                     const Secret& secret,
                                     std::string_view field_name,
                                     std::optional<std::chrono::seconds> time_limit,
                                     Clock clock) {
    if (candidate.empty()) {
        return unexpected(Error::csrf(CsrfError::TokenMissing));
    }

    std::string key(field_name);
    if (!session.has(key)) {
        return unexpected(Error::csrf(CsrfError::SessionMissing));
    }

    std::optional<int64_t> max_age;
    if (time_limit) {
        max_age = time_limit->count();
    }

    UrlSafeTimedSerializer serializer(secret, CSRF_TOKEN_SALT, std::move(clock));
    auto token = serializer.loads(candidate, max_age);
    if (!token) {
        return unexpected(Error::csrf(token.error() == SignatureError::Expired
                                          ? CsrfError::TokenExpired
                                          : CsrfError::TokenInvalid));
    }

    auto session_token = session.get<std::string>(key);
    if (!session_token || !signing::constant_time_equals(*session_token, *token)) {
        return unexpected(Error::csrf(CsrfError::TokenMismatch));
    }

    return {};
}

} // namespace coroform
