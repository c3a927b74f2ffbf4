#pragma once

#include <concepts>
#include <map>
#include <stdexcept>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "coroform/core/error.hpp"
#include "coroform/core/form_data.hpp"
#include "coroform/core/request.hpp"
#include "coroform/coro/cancellation.hpp"
#include "coroform/coro/task.hpp"
#include "coroform/form/field.hpp"
#include "coroform/util/expected.hpp"

namespace coroform {

// Validators that need to wait on something (a database, another service).
// The token is cancelled when a sibling validator throws.
using AsyncValidator = std::function<Task<ValidationResult>(Form&, Field&, CancellationToken)>;

// Additional validators per field name, run after the registered ones
using ExtraValidators = std::unordered_map<std::string, std::vector<Validator>>;

struct FormOptions {
    // Prepended to every input name
    std::string prefix;
};

// ============================================================================
// Form
// ============================================================================
//
// Forms declare their fields as members initialized through add():
//
//   class SignupForm : public Form {
//   public:
//       StringField& email = add<StringField>("email", {data_required(), coroform::email()});
//
//       SignupForm(Request& req, FormOptions options = {}) : Form(req, std::move(options)) {
//           async_validator("email", &SignupForm::email_is_free);
//       }
//
//       Task<ValidationResult> email_is_free(Field& field, CancellationToken token);
//   };
//
// When the request carries an enabled CSRF config the form gets a
// CsrfTokenField as its first field.

class Form {
    Request* request_;
    FormOptions options_;
    std::vector<std::unique_ptr<Field>> fields_;
    std::unordered_map<std::string, std::vector<Validator>> inline_validators_;
    std::unordered_map<std::string, AsyncValidator> async_validators_;
    CsrfTokenField* csrf_field_ = nullptr;

public:
    // Throws std::logic_error when CSRF is enabled but the session
    // middleware did not run
    explicit Form(Request& req, FormOptions options = {});
    virtual ~Form() = default;

    Form(const Form&) = delete;
    Form& operator=(const Form&) = delete;
    Form(Form&&) = default;
    Form& operator=(Form&&) = delete;

    Request& request() const noexcept { return *request_; }
    const std::string& prefix() const noexcept { return options_.prefix; }

    // ------------------------------------------------------------------
    // Fields
    // ------------------------------------------------------------------

    const std::vector<std::unique_ptr<Field>>& fields() const noexcept { return fields_; }

    // nullptr if no field has this name
    Field* field(std::string_view name) noexcept;
    const Field* field(std::string_view name) const noexcept;

    // Throws std::out_of_range for an unknown name or another field type
    template<typename F>
    F& field_as(std::string_view name) {
        if (auto* typed = dynamic_cast<F*>(field(name))) {
            return *typed;
        }
        throw std::out_of_range("form has no field '" + std::string(name) + "' of the requested type");
    }

    // ------------------------------------------------------------------
    // Data and validation
    // ------------------------------------------------------------------

    // Reset every field to its default, then apply formdata if given
    void process(const FormData* formdata);
    void process(const FormData& formdata) { process(&formdata); }

    // Runs the synchronous validators only
    bool validate_sync(const ExtraValidators& extra = {});

    // Runs the synchronous validators, then every registered async validator
    // of the fields that were not stopped early, concurrently. Validators
    // report failures through their result; anything they throw propagates
    // after the remaining async validators have finished.
    Task<bool> validate(ExtraValidators extra = {});

    // POST, PUT, PATCH or DELETE
    bool is_submitted() const noexcept;

    // validate() for submissions, false without validating otherwise
    Task<bool> validate_on_submit(ExtraValidators extra = {});

    // Field name to messages, only fields with errors
    std::map<std::string, std::vector<std::string>> errors() const;

    // ------------------------------------------------------------------
    // CSRF
    // ------------------------------------------------------------------

    bool has_csrf() const noexcept { return csrf_field_ != nullptr; }

    // Signed token to embed in the rendered form; empty without CSRF
    std::string csrf_token() const;

    // ------------------------------------------------------------------
    // Construction helpers
    // ------------------------------------------------------------------

    // Builds F from the request: submissions are processed with the parsed
    // body (JSON object or form encoding), other methods leave the defaults.
    // Fails when the body cannot be parsed.
    template<typename F = Form>
        requires std::derived_from<F, Form> && std::constructible_from<F, Request&, FormOptions>
    static Task<expected<F, Error>> from_submitted_data(Request& req, FormOptions options = {});

    // Builds F from explicitly supplied data regardless of the method
    template<typename F = Form>
        requires std::derived_from<F, Form> && std::constructible_from<F, Request&, FormOptions>
    static F from_data(Request& req, const FormData& data, FormOptions options = {});

protected:
    template<typename F, typename... Args>
    F& add(Args&&... args) {
        return emplace_field<F>(std::forward<Args>(args)...);
    }

    // Accepts a braced validator list
    template<typename F, typename... Args>
    F& add(std::string name, std::vector<Validator> validators, Args&&... args) {
        return emplace_field<F>(std::move(name), std::move(validators), std::forward<Args>(args)...);
    }

    // Runs after the field's declared validators
    void inline_validator(std::string field_name, Validator validator);

    template<typename F>
        requires std::derived_from<F, Form>
    void inline_validator(std::string field_name, ValidationResult (F::*fn)(Field&)) {
        inline_validator(std::move(field_name), [fn](Form& form, Field& field) {
            return (static_cast<F&>(form).*fn)(field);
        });
    }

    // One async validator per field; registering again replaces it
    void async_validator(std::string field_name, AsyncValidator validator);

    template<typename F>
        requires std::derived_from<F, Form>
    void async_validator(std::string field_name,
                         Task<ValidationResult> (F::*fn)(Field&, CancellationToken)) {
        async_validator(std::move(field_name), [fn](Form& form, Field& field, CancellationToken token) {
            return (static_cast<F&>(form).*fn)(field, std::move(token));
        });
    }

private:
    template<typename F, typename... Args>
    F& emplace_field(Args&&... args) {
        auto field = std::make_unique<F>(std::forward<Args>(args)...);
        field->bind(options_.prefix);
        F& ref = *field;
        fields_.push_back(std::move(field));
        return ref;
    }

    bool run_sync_validation(const ExtraValidators& extra, std::vector<Field*>* completed);
    Task<bool> run_async_validator(const AsyncValidator& validator, Field& field, CancellationSource& cancel);
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename F>
    requires std::derived_from<F, Form> && std::constructible_from<F, Request&, FormOptions>
Task<expected<F, Error>> Form::from_submitted_data(Request& req, FormOptions options) {
    if (!is_submit_method(req.method())) {
        F form(req, std::move(options));
        co_return std::move(form);
    }

    auto data = co_await read_formdata(req);
    if (!data) {
        co_return unexpected(data.error());
    }

    F form(req, std::move(options));
    form.process(*data);
    co_return std::move(form);
}

template<typename F>
    requires std::derived_from<F, Form> && std::constructible_from<F, Request&, FormOptions>
F Form::from_data(Request& req, const FormData& data, FormOptions options) {
    F form(req, std::move(options));
    form.process(data);
    return form;
}

} // namespace coroform
