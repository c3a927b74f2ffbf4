#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"
#include "coroform/coro/task.hpp"

namespace coroform {

// ============================================================================
// Handler and Middleware Types
// ============================================================================

using Handler = std::function<Task<Response>(Request&)>;

// Next function type - call to continue to next middleware/handler
using Next = std::function<Task<Response>(Request&)>;

// Middleware function type - receives request and next function
using Middleware = std::function<Task<Response>(Request&, Next)>;

// ============================================================================
// CompiledMiddlewareChain
// ============================================================================

class CompiledMiddlewareChain {
    std::vector<Middleware> middleware_;

public:
    void add(Middleware mw) {
        middleware_.push_back(std::move(mw));
    }

    bool empty() const noexcept { return middleware_.empty(); }
    size_t size() const noexcept { return middleware_.size(); }

    // Runs every middleware in registration order, then the handler
    Task<Response> execute(Request& req, const Handler& handler) const;

private:
    Task<Response> execute_at(size_t idx, Request& req, const Handler& handler) const;
};

// ============================================================================
// App - in-process request dispatch
// ============================================================================

// Routes match the request path exactly. Unknown paths answer 404, known
// paths without a handler for the method answer 405. Exceptions thrown by
// middleware or handlers propagate out of dispatch().
class App {
    std::unordered_map<std::string, std::unordered_map<HttpMethod, Handler>> routes_;
    CompiledMiddlewareChain middleware_chain_;

public:
    App() = default;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    App& route(HttpMethod method, std::string path, Handler handler);

    // Register one handler for several methods
    App& route(std::initializer_list<HttpMethod> methods, std::string path, Handler handler);

    App& get(std::string path, Handler handler) {
        return route(HttpMethod::GET, std::move(path), std::move(handler));
    }

    App& post(std::string path, Handler handler) {
        return route(HttpMethod::POST, std::move(path), std::move(handler));
    }

    App& put(std::string path, Handler handler) {
        return route(HttpMethod::PUT, std::move(path), std::move(handler));
    }

    App& patch(std::string path, Handler handler) {
        return route(HttpMethod::PATCH, std::move(path), std::move(handler));
    }

    App& del(std::string path, Handler handler) {
        return route(HttpMethod::DELETE, std::move(path), std::move(handler));
    }

    App& use(Middleware mw) {
        middleware_chain_.add(std::move(mw));
        return *this;
    }

    Task<Response> dispatch(Request& req) const;

private:
    const Handler* find_handler(const Request& req, int& status) const;
};

} // namespace coroform
