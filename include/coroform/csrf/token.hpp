#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "coroform/core/error.hpp"
#include "coroform/core/session.hpp"
#include "coroform/csrf/config.hpp"
#include "coroform/csrf/secret.hpp"
#include "coroform/csrf/signer.hpp"
#include "coroform/util/expected.hpp"

namespace coroform {

// Domain separation for CSRF signatures
inline constexpr std::string_view CSRF_TOKEN_SALT = "wtf-csrf-token";

// hex(SHA1(64 random bytes))
std::string new_session_token();

// Signed token for the session's CSRF token, creating that token when the
// session has none. Repeated calls with the same state and field name
// return the same signed value.
std::string generate_token(Session& session,
                           CsrfState& state,
                           const Secret& secret,
                           std::string_view field_name,
                           Clock clock = {});

// Checks a submitted signed token against the session's CSRF token
expected<void, Error> validate_token(const Session& session,
                                     std::string_view candidate,
                                     const Secret& secret,
                                     std::string_view field_name,
                                     std::optional<std::chrono::seconds> time_limit,
                                     Clock clock = {});

} // namespace coroform
