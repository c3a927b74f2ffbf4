#include "coroform/form/form.hpp"

#include <exception>

#include "coroform/core/logging.hpp"
#include "coroform/coro/when_all.hpp"
#include "coroform/csrf/config.hpp"

namespace coroform {

// ============================================================================
// Construction
// ============================================================================

Form::Form(Request& req, FormOptions options)
    : request_(&req)
    , options_(std::move(options))
{
    const auto* state = req.find_state<CsrfState>();
    if (state && state->config && state->config->enabled) {
        csrf_field_ = &add<CsrfTokenField>(req, state->config);
    }
}

Field* Form::field(std::string_view name) noexcept {
    for (auto& f : fields_) {
        if (f->name() == name) return f.get();
    }
    return nullptr;
}

const Field* Form::field(std::string_view name) const noexcept {
    for (const auto& f : fields_) {
        if (f->name() == name) return f.get();
    }
    return nullptr;
}

void Form::inline_validator(std::string field_name, Validator validator) {
    inline_validators_[std::move(field_name)].push_back(std::move(validator));
}

void Form::async_validator(std::string field_name, AsyncValidator validator) {
    async_validators_[std::move(field_name)] = std::move(validator);
}

// ============================================================================
// Processing
// ============================================================================

void Form::process(const FormData* formdata) {
    for (auto& f : fields_) {
        f->process(formdata);
    }
}

bool Form::is_submitted() const noexcept {
    return is_submit_method(request_->method());
}

std::string Form::csrf_token() const {
    return csrf_field_ ? csrf_field_->current_token() : std::string{};
}

std::map<std::string, std::vector<std::string>> Form::errors() const {
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& f : fields_) {
        if (!f->errors().empty()) {
            result.emplace(f->name(), f->errors());
        }
    }
    return result;
}

// ============================================================================
// Validation
// ============================================================================

bool Form::run_sync_validation(const ExtraValidators& extra, std::vector<Field*>* completed) {
    bool success = true;

    for (auto& f : fields_) {
        std::vector<Validator> chain;

        if (auto it = inline_validators_.find(f->name()); it != inline_validators_.end()) {
            chain.insert(chain.end(), it->second.begin(), it->second.end());
        }
        if (auto it = extra.find(f->name()); it != extra.end()) {
            chain.insert(chain.end(), it->second.begin(), it->second.end());
        }

        // Reached only when nothing before it stopped the chain
        if (completed && async_validators_.count(f->name())) {
            chain.push_back([completed](Form&, Field& field) -> ValidationResult {
                completed->push_back(&field);
                return std::nullopt;
            });
        }

        if (!f->validate(*this, chain)) {
            success = false;
        }
    }
    return success;
}

bool Form::validate_sync(const ExtraValidators& extra) {
    return run_sync_validation(extra, nullptr);
}

Task<bool> Form::run_async_validator(const AsyncValidator& validator, Field& field,
                                     CancellationSource& cancel) {
    try {
        auto failure = co_await validator(*this, field, cancel.token());
        if (!failure) {
            co_return true;
        }
        if (!failure->message.empty()) {
            field.add_error(std::move(failure->message));
        }
        co_return false;
    } catch (const std::exception& e) {
        auto entry = default_logger().entry(LogLevel::Error, "async validator failed");
        entry.field("field", field.name());
        entry.field("error", e.what());
        default_logger().log(entry);
        cancel.cancel();
        throw;
    } catch (...) {
        auto entry = default_logger().entry(LogLevel::Error, "async validator failed");
        entry.field("field", field.name());
        default_logger().log(entry);
        cancel.cancel();
        throw;
    }
}

Task<bool> Form::validate(ExtraValidators extra) {
    std::vector<Field*> completed;
    bool success = run_sync_validation(extra, &completed);

    CancellationSource cancel;
    std::vector<Task<bool>> tasks;
    tasks.reserve(completed.size());
    for (Field* f : completed) {
        tasks.push_back(run_async_validator(async_validators_.at(f->name()), *f, cancel));
    }

    auto results = co_await when_all(std::move(tasks));
    for (bool ok : results) {
        if (!ok) success = false;
    }
    co_return success;
}

Task<bool> Form::validate_on_submit(ExtraValidators extra) {
    if (!is_submitted()) {
        co_return false;
    }
    co_return co_await validate(std::move(extra));
}

} // namespace coroform
