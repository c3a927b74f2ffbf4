#include <catch2/catch.hpp>
#include <coroform/coroform.hpp>

#include <functional>

using namespace coroform;

namespace {

class BasicForm : public Form {
public:
    StringField& name = add<StringField>("name", {data_required()});
    FileField& avatar = add<FileField>("avatar");
    BooleanField& checkbox = add<BooleanField>("checkbox", {}, true);

    explicit BasicForm(Request& req, FormOptions options = {})
        : Form(req, std::move(options)) {}
};

class FormWithInlineValidators : public Form {
public:
    StringField& field1 = add<StringField>("field1");
    StringField& field2 = add<StringField>("field2");

    explicit FormWithInlineValidators(Request& req, FormOptions options = {})
        : Form(req, std::move(options)) {
        inline_validator("field1", &FormWithInlineValidators::check_field1);
        inline_validator("field2", &FormWithInlineValidators::check_field2);
    }

    ValidationResult check_field1(Field&) {
        if (field1.data() != "value1") return ValidationFailure::error("Field value is incorrect.");
        return std::nullopt;
    }

    ValidationResult check_field2(Field&) {
        if (field2.data() != "value2") return ValidationFailure::error("Field value is incorrect.");
        return std::nullopt;
    }
};

// Runs `body` as the handler of a single route and returns what it answered
std::string run_route(HttpMethod method, std::function<Task<Response>(Request&)> body,
                      std::function<Response(TestClient&)> call) {
    App app;
    app.route(method, "/", std::move(body));
    TestClient client(app);
    return std::string(call(client).body());
}

} // namespace

TEST_CASE("Form populated from a GET request keeps defaults", "[form]") {
    bool checked = false;
    run_route(HttpMethod::GET, [&](Request& req) -> Task<Response> {
        auto form = co_await Form::from_submitted_data<BasicForm>(req);
        REQUIRE(form);
        REQUIRE(!form->name.data());
        REQUIRE(!form->avatar.data());
        REQUIRE(form->checkbox.data());
        REQUIRE(form->name.raw_data() == std::nullopt);
        checked = true;
        co_return Response::ok();
    }, [](TestClient& c) { return c.get("/"); });
    REQUIRE(checked);
}

TEST_CASE("Form populated from submissions", "[form]") {
    std::string name;
    std::string filename;

    auto handler = [&](Request& req) -> Task<Response> {
        auto form = co_await Form::from_submitted_data<BasicForm>(req);
        if (!form) co_return error_response(form.error());
        name = form->name.data().value_or("<none>");
        filename = form->avatar.data() ? form->avatar.data()->filename : "<none>";
        co_return Response::ok(form->checkbox.data() ? "checked" : "unchecked");
    };

    SECTION("urlencoded") {
        auto body = run_route(HttpMethod::POST, handler,
                              [](TestClient& c) { return c.post_form("/", {{"name", "x"}}); });
        REQUIRE(name == "x");
        // Unchecked boxes are absent from submissions
        REQUIRE(body == "unchecked");
    }

    SECTION("multipart with a file") {
        FormData data;
        FormField avatar;
        avatar.name = "avatar";
        avatar.filename = "starlette.png";
        avatar.content_type = "image/png";
        avatar.is_file = true;
        data.add(avatar);
        data.add("checkbox", "y");

        auto body = run_route(HttpMethod::POST, handler,
                              [&](TestClient& c) { return c.post_multipart("/", data); });
        REQUIRE(filename == "starlette.png");
        REQUIRE(name == "<none>");
        REQUIRE(body == "checked");
    }

    SECTION("json") {
        run_route(HttpMethod::POST, handler,
                  [](TestClient& c) { return c.post_json("/", {{"name", "json"}}); });
        REQUIRE(name == "json");
    }

    SECTION("malformed body") {
        auto body = run_route(HttpMethod::POST, handler, [](TestClient& c) {
            return c.request(HttpMethod::POST, "/", "{oops", {{"Content-Type", "application/json"}});
        });
        REQUIRE(body == "Malformed JSON body");
    }
}

TEST_CASE("Form populated manually", "[form]") {
    std::string seen;

    SECTION("from query parameters") {
        run_route(HttpMethod::POST, [&](Request& req) -> Task<Response> {
            FormData data;
            for (const auto& [key, value] : req.query_params()) {
                data.add(key, value);
            }
            auto form = Form::from_data<BasicForm>(req, data);
            seen = form.name.data().value_or("<none>");
            co_return Response::ok();
        }, [](TestClient& c) { return c.post_form("/?name=args", {}); });
        REQUIRE(seen == "args");
    }

    SECTION("construction alone ignores the body") {
        run_route(HttpMethod::POST, [&](Request& req) -> Task<Response> {
            BasicForm form(req);
            seen = form.name.data().value_or("<none>");
            co_return Response::ok();
        }, [](TestClient& c) { return c.post_form("/", {{"name", "ignore"}}); });
        REQUIRE(seen == "<none>");
    }

    SECTION("process after construction") {
        run_route(HttpMethod::POST, [&](Request& req) -> Task<Response> {
            BasicForm form(req);
            auto data = co_await read_formdata(req);
            form.process(*data);
            seen = form.name.data().value_or("<none>");
            co_return Response::ok();
        }, [](TestClient& c) { return c.post_form("/", {{"name", "x"}}); });
        REQUIRE(seen == "x");
    }

    SECTION("explicit data wins over the body") {
        run_route(HttpMethod::POST, [&](Request& req) -> Task<Response> {
            auto form = Form::from_data<BasicForm>(req, FormData{{"name", "value1"}});
            co_await form.validate();
            seen = form.name.data().value_or("<none>");
            co_return Response::ok();
        }, [](TestClient& c) { return c.post_form("/", {{"name", "value0"}}); });
        REQUIRE(seen == "value1");
    }
}

TEST_CASE("Form is_submitted", "[form]") {
    App app;
    app.route({HttpMethod::GET, HttpMethod::POST, HttpMethod::PUT, HttpMethod::PATCH, HttpMethod::DELETE}, "/",
              [](Request& req) -> Task<Response> {
                  auto form = co_await Form::from_submitted_data<BasicForm>(req);
                  co_return Response::ok(form->is_submitted() ? "True" : "False");
              });
    TestClient client(app);

    REQUIRE(client.get("/").body() == "False");
    REQUIRE(client.request(HttpMethod::POST, "/").body() == "True");
    REQUIRE(client.request(HttpMethod::PUT, "/").body() == "True");
    REQUIRE(client.request(HttpMethod::PATCH, "/").body() == "True");
    REQUIRE(client.request(HttpMethod::DELETE, "/").body() == "True");
}

TEST_CASE("Form validate reports errors by field name", "[form]") {
    Request req;
    BasicForm form(req);
    form.process(nullptr);

    REQUIRE(!form.validate().sync_wait());
    auto errors = form.errors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors["name"] == std::vector<std::string>{"This field is required."});
}

TEST_CASE("Form validate_on_submit", "[form]") {
    App app;
    app.route({HttpMethod::GET, HttpMethod::POST}, "/", [](Request& req) -> Task<Response> {
        auto form = co_await Form::from_submitted_data<BasicForm>(req);
        if (co_await form->validate_on_submit()) {
            REQUIRE(req.method() == HttpMethod::POST);
        }
        co_return Response::ok(form->errors().count("name") ? "True" : "False");
    });
    TestClient client(app);

    REQUIRE(client.get("/").body() == "False");
    REQUIRE(client.post_form("/", {}).body() == "True");
    REQUIRE(client.post_form("/", {{"name", "value"}}).body() == "False");
}

TEST_CASE("Form inline validators", "[form]") {
    Request req;
    req.set_method(HttpMethod::POST);

    SECTION("success") {
        auto form = Form::from_data<FormWithInlineValidators>(req, {{"field1", "value1"}, {"field2", "value2"}});
        REQUIRE(form.validate_sync());
        REQUIRE(form.errors().empty());
        REQUIRE(form.field1.data() == "value1");
    }

    SECTION("failure") {
        auto form = Form::from_data<FormWithInlineValidators>(req, {{"field1", "xxx1"}, {"field2", "xxx2"}});
        REQUIRE(!form.validate_sync());
        auto errors = form.errors();
        REQUIRE(errors.count("field1"));
        REQUIRE(errors.count("field2"));
        REQUIRE(form.field1.data() == "xxx1");
    }

    SECTION("extra validators run after the inline ones") {
        auto form = Form::from_data<FormWithInlineValidators>(req, {{"field1", "xxx1"}, {"field2", "value2"}});
        ExtraValidators extra;
        extra["field1"].push_back([](Form&, Field&) -> ValidationResult {
            return ValidationFailure::error("extra");
        });
        REQUIRE(!form.validate_sync(extra));
        REQUIRE(form.errors()["field1"] == std::vector<std::string>{"Field value is incorrect.", "extra"});
    }
}

TEST_CASE("Form prefix", "[form]") {
    Request req;
    auto form = Form::from_data<FormWithInlineValidators>(
        req, {{"myprefix-field1", "value1"}, {"field2", "value2"}}, FormOptions{"myprefix-"});

    REQUIRE(form.prefix() == "myprefix-");
    REQUIRE(form.field1.input_name() == "myprefix-field1");
    REQUIRE(form.field1.name() == "field1");
    REQUIRE(form.field1.data() == "value1");
    REQUIRE(!form.field2.data());
}

TEST_CASE("Form field lookup", "[form]") {
    Request req;
    BasicForm form(req);

    REQUIRE(form.fields().size() == 3);
    REQUIRE(form.field("name") == &form.name);
    REQUIRE(form.field("missing") == nullptr);
    REQUIRE(&form.field_as<BooleanField>("checkbox") == &form.checkbox);
    REQUIRE_THROWS_AS(form.field_as<IntegerField>("checkbox"), std::out_of_range);
    REQUIRE(!form.has_csrf());
    REQUIRE(form.csrf_token().empty());
}

TEST_CASE("Form keeps its fields when moved", "[form]") {
    Request req;
    auto form = Form::from_data<BasicForm>(req, {{"name", "moved"}});
    BasicForm other = std::move(form);

    REQUIRE(other.name.data() == "moved");
    REQUIRE(other.field("name") == &other.name);
    REQUIRE(other.validate_sync());
}
