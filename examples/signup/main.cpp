// Signup Example
// Demonstrates CSRF protection and async form validation with coroform
//
// Everything runs in-process: requests go through TestClient, which keeps
// the session cookie between calls like a browser would.
//
// Run with:
//   ./coroform_signup_example

#include <coroform/coroform.hpp>

#include <iostream>
#include <set>

using namespace coroform;

// Stands in for a user table that is expensive to query
class UserDirectory {
    std::set<std::string> emails_ = {"taken@example.com"};

public:
    Task<bool> email_exists(std::string email) const {
        co_return emails_.count(email) > 0;
    }

    void add(std::string email) { emails_.insert(std::move(email)); }
};

class SignupForm : public Form {
    UserDirectory* users_ = nullptr;

public:
    StringField& username = add<StringField>("username", {data_required(), length(3, 20)});
    StringField& email = add<StringField>("email", {data_required(), coroform::email()});
    StringField& password = add<StringField>("password", {input_required(), length(8)});
    StringField& confirm = add<StringField>("confirm", {equal_to("password", "Passwords must match.")});

    SignupForm(Request& req, FormOptions options = {})
        : Form(req, std::move(options)) {
        async_validator("email", &SignupForm::email_is_free);
    }

    void use_directory(UserDirectory& users) { users_ = &users; }

    Task<ValidationResult> email_is_free(Field& field, CancellationToken token) {
        if (!users_ || token.is_cancelled()) {
            co_return std::nullopt;
        }
        if (co_await users_->email_exists(*field.text())) {
            co_return ValidationFailure::error("This email is already registered.");
        }
        co_return std::nullopt;
    }
};

std::string render(const SignupForm& form) {
    std::string html = "<form method=\"post\" action=\"/signup\">\n";
    for (const auto& field : form.fields()) {
        html += "  <input type=\"" + std::string(field->input_type()) + "\" name=\"" +
                field->input_name() + "\" value=\"" + field->render_value() + "\">\n";
        for (const auto& error : field->errors()) {
            html += "  <p class=\"error\">" + error + "</p>\n";
        }
    }
    return html + "</form>\n";
}

// Pulls the hidden token back out of the rendered page
std::string scrape_token(std::string_view html) {
    constexpr std::string_view marker = "name=\"csrf_token\" value=\"";
    auto start = html.find(marker);
    if (start == std::string_view::npos) return {};
    start += marker.size();
    return std::string(html.substr(start, html.find('"', start) - start));
}

void print(std::string_view label, const Response& resp) {
    std::cout << "== " << label << " -> " << resp.status() << "\n" << resp.body() << "\n";
}

int main() {
    try {
        CsrfConfig config = CsrfConfig::from_env();
        if (config.secret.empty()) {
            config.secret = "signup-example-secret";
        }

        UserDirectory users;

        App app;
        app.use(sessions());
        app.use(csrf_protect_middleware(std::move(config)));

        app.route({HttpMethod::GET, HttpMethod::POST}, "/signup", csrf_protect([&users](Request& req) -> Task<Response> {
            auto form = co_await Form::from_submitted_data<SignupForm>(req);
            if (!form) {
                co_return error_response(form.error());
            }
            form->use_directory(users);

            if (co_await form->validate_on_submit()) {
                users.add(*form->email.data());
                co_return Response::redirect("/welcome");
            }
            co_return Response::html(render(*form));
        }));

        TestClient client(app);

        auto page = client.get("/signup");
        print("GET /signup", page);
        auto token = scrape_token(page.body());

        print("POST without token", client.post_form("/signup", {
            {"username", "alice"}, {"email", "alice@example.com"},
            {"password", "correct horse"}, {"confirm", "correct horse"},
        }));

        print("POST with a registered email", client.post_form("/signup", {
            {"csrf_token", token}, {"username", "bob"}, {"email", "taken@example.com"},
            {"password", "correct horse"}, {"confirm", "battery staple"},
        }));

        print("POST valid", client.post_form("/signup", {
            {"csrf_token", token}, {"username", "alice"}, {"email", "alice@example.com"},
            {"password", "correct horse"}, {"confirm", "correct horse"},
        }));

        print("POST token in header", client.post_json("/signup", {
            {"username", "carol"}, {"email", "carol@example.com"},
            {"password", "correct horse"}, {"confirm", "correct horse"},
        }, {{"X-CSRFToken", token}}));
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
