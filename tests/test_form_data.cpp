#include <catch2/catch.hpp>
#include <coroform/core/form_data.hpp>
#include <coroform/core/test_client.hpp>

using namespace coroform;

namespace {

Request make_request(std::string content_type, std::string body) {
    Request req;
    req.set_method(HttpMethod::POST);
    req.add_header("Content-Type", std::move(content_type));
    req.set_body(std::move(body));
    return req;
}

} // namespace

TEST_CASE("FormData lookup", "[form_data]") {
    FormData data{{"tag", "a"}, {"name", "x"}, {"tag", "b"}};

    REQUIRE(data.size() == 3);
    REQUIRE(data.has("tag"));
    REQUIRE(!data.has("absent"));
    REQUIRE(data.get("tag") == "a");
    REQUIRE(data.get_all("tag") == std::vector<std::string_view>{"a", "b"});
    REQUIRE(data.get_fields("tag").size() == 2);
    REQUIRE(data.get_field("name")->value == "x");
    REQUIRE(data.get_field("absent") == nullptr);
    REQUIRE(data.fields()[1].name == "name");
}

TEST_CASE("parse_urlencoded", "[form_data]") {
    auto data = form::parse_urlencoded("name=John+Doe&tag=a&tag=b&empty=&flag&=orphan&x%20y=%3D");
    REQUIRE(data);
    REQUIRE(data->get("name") == "John Doe");
    REQUIRE(data->get_all("tag").size() == 2);
    REQUIRE(data->get("empty") == "");
    REQUIRE(data->get("flag") == "");
    REQUIRE(data->get("x y") == "=");
    REQUIRE(!data->has(""));
}

TEST_CASE("parse_multipart", "[form_data]") {
    const std::string body =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"name\"\r\n"
        "\r\n"
        "Alice\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"upload\"; filename=\"notes.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "line one\r\nline two\r\n"
        "--XyZ--\r\n";

    SECTION("text and file parts") {
        auto data = form::parse_multipart(body, "XyZ");
        REQUIRE(data);
        REQUIRE(data->size() == 2);
        REQUIRE(data->get("name") == "Alice");

        auto* file = data->get_field("upload");
        REQUIRE(file != nullptr);
        REQUIRE(file->is_file);
        REQUIRE(file->filename == "notes.txt");
        REQUIRE(file->content_type == "text/plain");
        REQUIRE(file->value == "line one\r\nline two");
    }

    SECTION("empty body with closing delimiter") {
        auto data = form::parse_multipart("--XyZ--\r\n", "XyZ");
        REQUIRE(data);
        REQUIRE(data->empty());
    }

    SECTION("malformed bodies are bad requests") {
        REQUIRE(form::parse_multipart(body, "other").error().http_status() == 400);
        REQUIRE(!form::parse_multipart("--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nno end", "XyZ"));
        REQUIRE(!form::parse_multipart("--XyZjunk", "XyZ"));
        REQUIRE(!form::parse_multipart(body, ""));
    }

    SECTION("matches the client encoder") {
        FormData sent;
        sent.add("name", "Bob");
        FormField upload;
        upload.name = "avatar";
        upload.value = "\x89PNG";
        upload.filename = "me.png";
        upload.content_type = "image/png";
        upload.is_file = true;
        sent.add(upload);

        auto data = form::parse_multipart(encode_multipart(sent, "b0undary"), "b0undary");
        REQUIRE(data);
        REQUIRE(data->get("name") == "Bob");
        REQUIRE(data->get_field("avatar")->filename == "me.png");
        REQUIRE(data->get_field("avatar")->value == "\x89PNG");
    }
}

TEST_CASE("extract_boundary", "[form_data]") {
    REQUIRE(form::extract_boundary("multipart/form-data; boundary=abc") == "abc");
    REQUIRE(form::extract_boundary("multipart/form-data; Boundary=\"q u\"") == "q u");
    REQUIRE(!form::extract_boundary("multipart/form-data"));
    REQUIRE(!form::extract_boundary("multipart/form-data; boundary="));
}

TEST_CASE("parse_json_object", "[form_data]") {
    SECTION("flattens values") {
        auto data = form::parse_json_object(
            R"({"name": "Ann", "age": 31, "admin": true, "tags": ["a", "b"], "note": null})");
        REQUIRE(data);
        REQUIRE(data->get("name") == "Ann");
        REQUIRE(data->get("age") == "31");
        REQUIRE(data->get("admin") == "true");
        REQUIRE(data->get_all("tags").size() == 2);
        REQUIRE(!data->has("note"));
    }

    SECTION("rejects non-objects") {
        REQUIRE(form::parse_json_object("[1, 2]").error().http_status() == 400);
        REQUIRE(form::parse_json_object("\"text\"").error().http_status() == 400);
        REQUIRE(form::parse_json_object("{broken").error().http_status() == 400);
    }
}

TEST_CASE("form::parse picks the parser from the media type", "[form_data]") {
    SECTION("urlencoded with charset") {
        auto req = make_request("application/x-www-form-urlencoded; charset=UTF-8", "a=1");
        REQUIRE(form::parse(req)->get("a") == "1");
    }

    SECTION("json") {
        auto req = make_request("application/json", R"({"a": "1"})");
        REQUIRE(form::parse(req)->get("a") == "1");
    }

    SECTION("multipart without boundary") {
        auto req = make_request("multipart/form-data", "");
        REQUIRE(!form::parse(req));
    }

    SECTION("unknown types give empty data") {
        auto req = make_request("text/plain", "a=1");
        auto data = form::parse(req);
        REQUIRE(data);
        REQUIRE(data->empty());
    }
}

TEST_CASE("read_formdata caches the parsed body", "[form_data]") {
    auto req = make_request("application/x-www-form-urlencoded", "a=1");

    auto first = read_formdata(req).sync_wait();
    REQUIRE(first);
    REQUIRE(first->get("a") == "1");

    req.set_body("a=2");
    auto second = read_formdata(req).sync_wait();
    REQUIRE(second->get("a") == "1");
}
