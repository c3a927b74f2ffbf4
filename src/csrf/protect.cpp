#include "coroform/csrf/protect.hpp"

#include <stdexcept>

#include "coroform/core/error.hpp"
#include "coroform/core/logging.hpp"
#include "coroform/core/session.hpp"
#include "coroform/csrf/origin.hpp"
#include "coroform/csrf/token.hpp"

namespace coroform {

// ============================================================================
// CsrfProtect
// ============================================================================

CsrfProtect::CsrfProtect(CsrfConfig config) {
    config.validate();
    config_ = std::make_shared<const CsrfConfig>(std::move(config));
}

Task<Response> CsrfProtect::operator()(Request& req, Next next) const {
    req.state<CsrfState>().config = config_;
    co_return co_await next(req);
}

Middleware csrf_protect_middleware(CsrfConfig config) {
    auto middleware = std::make_shared<CsrfProtect>(std::move(config));

    return [middleware](Request& req, Next next) -> Task<Response> {
        co_return co_await (*middleware)(req, std::move(next));
    };
}

std::shared_ptr<const CsrfConfig> csrf_config(const Request& req) {
    auto* state = req.find_state<CsrfState>();
    return state ? state->config : nullptr;
}

// ============================================================================
// Gate
// ============================================================================

namespace {

CsrfState& require_csrf_state(Request& req) {
    auto* state = req.find_state<CsrfState>();
    if (!state || !state->config) {
        throw std::logic_error("CSRF protection used without the CSRF middleware");
    }
    return *state;
}

std::shared_ptr<Session> require_session(const Request& req) {
    auto sess = session(req);
    if (!sess) {
        throw std::logic_error("CSRF protection used without the session middleware");
    }
    return sess;
}

Response reject(const Request& req, const Error& error) {
    auto entry = default_logger().entry(LogLevel::Warn, "CSRF check failed");
    entry.field("reason", error.message());
    entry.field("method", method_to_string(req.method()));
    entry.field("path", req.path());
    default_logger().log(entry);

    return error_response(error);
}

Task<Response> run_protected(Handler handler, Request& req) {
    if (!is_submit_method(req.method())) {
        co_return co_await handler(req);
    }

    auto& state = require_csrf_state(req);
    auto config = state.config;
    if (!config->enabled) {
        co_return co_await handler(req);
    }
    auto sess = require_session(req);

    auto token = co_await extract_token(req, *config);
    if (!token) {
        co_return reject(req, token.error());
    }

    auto valid = validate_token(*sess, token->value_or(""), config->secret,
                                config->field_name, config->time_limit);
    if (!valid) {
        co_return reject(req, valid.error());
    }

    if (req.scheme() == "https" && config->ssl_strict) {
        auto origin = check_referrer(req);
        if (!origin) {
            co_return reject(req, origin.error());
        }
    }

    state.validated = true;
    co_return co_await handler(req);
}

} // anonymous namespace

Handler csrf_protect(Handler handler) {
    return [handler = std::move(handler)](Request& req) -> Task<Response> {
        return run_protected(handler, req);
    };
}

std::string csrf_token(Request& req) {
    auto& state = require_csrf_state(req);
    if (!state.config->enabled) {
        return {};
    }
    auto sess = require_session(req);
    return generate_token(*sess, state, state.config->secret, state.config->field_name);
}

} // namespace coroform
