#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "coroform/core/form_data.hpp"
#include "coroform/csrf/config.hpp"

namespace coroform {

class Form;
class Field;

// ============================================================================
// Validation results
// ============================================================================

// A failed check. An empty message stops the chain without reporting.
struct ValidationFailure {
    std::string message;

    // Skip the rest of this field's validators
    bool stop = false;

    static ValidationFailure error(std::string message) {
        return ValidationFailure{std::move(message), false};
    }

    static ValidationFailure stop_chain(std::string message = {}) {
        return ValidationFailure{std::move(message), true};
    }
};

using ValidationResult = std::optional<ValidationFailure>;

using Validator = std::function<ValidationResult(Form&, Field&)>;

// ============================================================================
// Field
// ============================================================================

class Field {
    std::string name_;
    std::string input_name_;
    std::string label_;
    std::vector<Validator> validators_;

    // Submitted values; nullopt when the form was not given any data
    std::optional<std::vector<std::string>> raw_data_;

    std::vector<std::string> process_errors_;
    std::vector<std::string> errors_;

public:
    Field(std::string name, std::vector<Validator> validators, std::string label);
    virtual ~Field() = default;

    Field(const Field&) = delete;
    Field& operator=(const Field&) = delete;

    // Name inside the form, used for error keys and validator registration
    const std::string& name() const noexcept { return name_; }

    // Name of the submitted value: the form prefix followed by name()
    const std::string& input_name() const noexcept { return input_name_; }

    const std::string& label() const noexcept { return label_; }

    const std::optional<std::vector<std::string>>& raw_data() const noexcept { return raw_data_; }

    const std::vector<std::string>& errors() const noexcept { return errors_; }
    const std::vector<std::string>& process_errors() const noexcept { return process_errors_; }

    void add_error(std::string message) { errors_.push_back(std::move(message)); }

    void bind(std::string_view prefix);

    // Resets the field to its default, then applies the submitted values when
    // formdata is given. Conversion failures become process errors.
    void process(const FormData* formdata);
    void process(const FormData& formdata) { process(&formdata); }

    // Process errors, pre_validate(), then the declared validators followed
    // by `extra`, stopping at the first failure that asks to stop. Returns
    // true when the field has no errors afterwards.
    bool validate(Form& form, const std::vector<Validator>& extra = {});

    // Whether the value counts as given for data_required()
    virtual bool has_data() const = 0;

    // Textual value for length, equality and format checks
    virtual std::optional<std::string> text() const = 0;

    // Value to put back into the rendered input
    virtual std::string render_value() const;

    virtual std::string_view input_type() const noexcept { return "text"; }

protected:
    virtual void reset_to_default() = 0;

    // Returns a process error message on conversion failure
    virtual std::optional<std::string> process_formdata(const std::vector<const FormField*>& values) = 0;

    virtual ValidationResult pre_validate(Form&) { return std::nullopt; }
};

// "first_name" -> "First Name"
std::string default_label(std::string_view name);

// ============================================================================
// Concrete fields
// ============================================================================

class StringField : public Field {
    std::optional<std::string> default_;
    std::optional<std::string> data_;

public:
    explicit StringField(std::string name,
                         std::vector<Validator> validators = {},
                         std::optional<std::string> default_value = std::nullopt,
                         std::string label = {});

    const std::optional<std::string>& data() const noexcept { return data_; }
    void set_data(std::optional<std::string> value) { data_ = std::move(value); }

    bool has_data() const override;
    std::optional<std::string> text() const override { return data_; }

protected:
    void reset_to_default() override { data_ = default_; }
    std::optional<std::string> process_formdata(const std::vector<const FormField*>& values) override;
};

class PasswordField : public StringField {
public:
    using StringField::StringField;

    // Submitted passwords are never echoed back
    std::string render_value() const override { return {}; }
    std::string_view input_type() const noexcept override { return "password"; }
};

class HiddenField : public StringField {
public:
    using StringField::StringField;

    std::string_view input_type() const noexcept override { return "hidden"; }
};

class IntegerField : public Field {
    std::optional<int64_t> default_;
    std::optional<int64_t> data_;

public:
    explicit IntegerField(std::string name,
                          std::vector<Validator> validators = {},
                          std::optional<int64_t> default_value = std::nullopt,
                          std::string label = {});

    const std::optional<int64_t>& data() const noexcept { return data_; }

    // Zero counts as missing, as it does for a required number input
    bool has_data() const override { return data_.has_value() && *data_ != 0; }
    std::optional<std::string> text() const override;
    std::string render_value() const override;
    std::string_view input_type() const noexcept override { return "number"; }

protected:
    void reset_to_default() override { data_ = default_; }
    std::optional<std::string> process_formdata(const std::vector<const FormField*>& values) override;
};

class BooleanField : public Field {
    bool default_;
    bool data_;

public:
    explicit BooleanField(std::string name,
                          std::vector<Validator> validators = {},
                          bool default_value = false,
                          std::string label = {});

    bool data() const noexcept { return data_; }

    bool has_data() const override { return data_; }
    std::optional<std::string> text() const override { return data_ ? "y" : ""; }
    std::string render_value() const override { return "y"; }
    std::string_view input_type() const noexcept override { return "checkbox"; }

protected:
    void reset_to_default() override { data_ = default_; }
    std::optional<std::string> process_formdata(const std::vector<const FormField*>& values) override;
};

class FileField : public Field {
    std::optional<FormField> data_;

public:
    explicit FileField(std::string name,
                       std::vector<Validator> validators = {},
                       std::string label = {});

    // The submitted part, with filename and content type for uploads
    const std::optional<FormField>& data() const noexcept { return data_; }

    bool has_data() const override { return data_.has_value(); }
    std::optional<std::string> text() const override;
    std::string render_value() const override { return {}; }
    std::string_view input_type() const noexcept override { return "file"; }

protected:
    void reset_to_default() override { data_.reset(); }
    std::optional<std::string> process_formdata(const std::vector<const FormField*>& values) override;
};

// ============================================================================
// CsrfTokenField
// ============================================================================

// Hidden field carrying the signed CSRF token. The token is issued when the
// field is created; validation is skipped when the CSRF gate already
// accepted the request.
class CsrfTokenField : public HiddenField {
    Request* request_;
    std::shared_ptr<const CsrfConfig> config_;
    std::string current_token_;

public:
    // Throws std::logic_error when the session middleware did not run
    CsrfTokenField(Request& req, std::shared_ptr<const CsrfConfig> config);

    // Signed token issued for this request
    const std::string& current_token() const noexcept { return current_token_; }

    std::string render_value() const override { return current_token_; }

protected:
    ValidationResult pre_validate(Form& form) override;
};

} // namespace coroform
