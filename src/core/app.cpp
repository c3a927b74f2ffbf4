#include "coroform/core/app.hpp"

namespace coroform {

// ============================================================================
// CompiledMiddlewareChain
// ============================================================================

Task<Response> CompiledMiddlewareChain::execute(Request& req, const Handler& handler) const {
    if (middleware_.empty()) {
        co_return co_await handler(req);
    }
    co_return co_await execute_at(0, req, handler);
}

Task<Response> CompiledMiddlewareChain::execute_at(size_t idx, Request& req,
                                                   const Handler& handler) const {
    if (idx >= middleware_.size()) {
        co_return co_await handler(req);
    }

    Next next = [this, idx, &handler](Request& r) -> Task<Response> {
        return execute_at(idx + 1, r, handler);
    };

    co_return co_await middleware_[idx](req, std::move(next));
}

// ============================================================================
// App
// ============================================================================

App& App::route(HttpMethod method, std::string path, Handler handler) {
    routes_[std::move(path)][method] = std::move(handler);
    return *this;
}

App& App::route(std::initializer_list<HttpMethod> methods, std::string path, Handler handler) {
    auto& by_method = routes_[std::move(path)];
    for (auto method : methods) {
        by_method[method] = handler;
    }
    return *this;
}

const Handler* App::find_handler(const Request& req, int& status) const {
    auto path_it = routes_.find(std::string(req.path()));
    if (path_it == routes_.end()) {
        status = 404;
        return nullptr;
    }

    auto method_it = path_it->second.find(req.method());
    if (method_it == path_it->second.end()) {
        status = 405;
        return nullptr;
    }
    return &method_it->second;
}

Task<Response> App::dispatch(Request& req) const {
    int status = 200;
    const Handler* handler = find_handler(req, status);

    if (!handler) {
        // Middleware still runs so sessions and CSRF state behave the same
        // for unrouted requests
        Handler fallback = [status](Request&) -> Task<Response> {
            co_return status == 405 ? Response::method_not_allowed() : Response::not_found();
        };
        co_return co_await middleware_chain_.execute(req, fallback);
    }

    co_return co_await middleware_chain_.execute(req, *handler);
}

} // namespace coroform
