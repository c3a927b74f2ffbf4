#include <catch2/catch.hpp>
#include <coroform/core/request.hpp>
#include <coroform/core/url.hpp>

using namespace coroform;

TEST_CASE("HTTP methods", "[request]") {
    SECTION("parse and print") {
        REQUIRE(parse_method("PATCH") == HttpMethod::PATCH);
        REQUIRE(parse_method("BREW") == HttpMethod::UNKNOWN);
        REQUIRE(method_to_string(HttpMethod::DELETE) == "DELETE");
    }

    SECTION("submission methods") {
        REQUIRE(is_submit_method(HttpMethod::POST));
        REQUIRE(is_submit_method(HttpMethod::PUT));
        REQUIRE(is_submit_method(HttpMethod::PATCH));
        REQUIRE(is_submit_method(HttpMethod::DELETE));
        REQUIRE(!is_submit_method(HttpMethod::GET));
        REQUIRE(!is_submit_method(HttpMethod::HEAD));
        REQUIRE(!is_submit_method(HttpMethod::OPTIONS));
    }
}

TEST_CASE("Request headers", "[request]") {
    Request req;
    req.add_header("X-CSRFToken", "abc");
    req.add_header("Content-Type", "Application/JSON; charset=utf-8");

    SECTION("lookup is case-insensitive") {
        REQUIRE(req.header("x-csrftoken") == "abc");
        REQUIRE(req.header("X-CSRFTOKEN") == "abc");
        REQUIRE(!req.header("X-CSRF-Token"));
    }

    SECTION("adding again replaces") {
        req.add_header("x-csrftoken", "def");
        REQUIRE(req.header("X-CSRFToken") == "def");
        REQUIRE(req.headers().size() == 2);
    }

    SECTION("media type") {
        REQUIRE(req.media_type() == "application/json");
    }

    SECTION("content length") {
        REQUIRE(!req.content_length());
        req.add_header("Content-Length", "12");
        REQUIRE(req.content_length() == 12u);
    }
}

TEST_CASE("Request query string", "[request]") {
    Request req;
    req.set_query_string("page=2&q=hello+world&tag=%41b&flag");

    REQUIRE(req.query_params().size() == 4);
    REQUIRE(*req.query<int>("page") == 2);
    REQUIRE(*req.query("q") == "hello world");
    REQUIRE(*req.query("tag") == "Ab");
    REQUIRE(*req.query("flag") == "");

    auto missing = req.query<int>("absent");
    REQUIRE(!missing);
    REQUIRE(missing.error().http_status() == 400);

    auto bad = req.query<int>("q");
    REQUIRE(!bad);
}

TEST_CASE("Request url from Host", "[request][url]") {
    Request req;
    req.set_path("/submit");
    req.set_query_string("a=1");

    SECTION("without Host") {
        REQUIRE(!req.url());
    }

    SECTION("plain host") {
        req.add_header("Host", "testserver");
        auto url = req.url();
        REQUIRE(url);
        REQUIRE(url->scheme == "http");
        REQUIRE(url->host == "testserver");
        REQUIRE(!url->port);
        REQUIRE(url->path == "/submit");
        REQUIRE(url->query == "a=1");
    }

    SECTION("https with port") {
        req.set_scheme("https");
        req.add_header("Host", "Example.COM:8443");
        auto url = req.url();
        REQUIRE(url);
        REQUIRE(url->secure());
        REQUIRE(url->hostname() == "example.com");
        REQUIRE(url->port == 8443);
    }
}

TEST_CASE("parse_url", "[url]") {
    SECTION("full URL") {
        auto url = parse_url("HTTPS://user:pw@Example.com:8080/a/b?x=1#frag");
        REQUIRE(url);
        REQUIRE(url->scheme == "https");
        REQUIRE(url->host == "Example.com");
        REQUIRE(url->port == 8080);
        REQUIRE(url->path == "/a/b");
        REQUIRE(url->query == "x=1");
    }

    SECTION("bare host") {
        auto url = parse_url("http://testserver");
        REQUIRE(url);
        REQUIRE(url->path == "/");
        REQUIRE(!url->port);
    }

    SECTION("IPv6 literal") {
        auto url = parse_url("http://[::1]:9000/");
        REQUIRE(url);
        REQUIRE(url->host == "[::1]");
        REQUIRE(url->port == 9000);
    }

    SECTION("rejects") {
        REQUIRE(!parse_url("/relative/path"));
        REQUIRE(!parse_url("http://"));
        REQUIRE(!parse_url("http://host:99999/"));
        REQUIRE(!parse_url("http://host:abc/"));
    }
}

TEST_CASE("URL encoding", "[request]") {
    SECTION("decode") {
        REQUIRE(url_decode("a+b%20c") == "a b c");
        REQUIRE(url_decode("%zz") == "%zz");
        REQUIRE(url_decode("trailing%4") == "trailing%4");
    }

    SECTION("encode") {
        REQUIRE(url_encode("a b&c=d") == "a+b%26c%3Dd");
        REQUIRE(url_encode("safe-_.~") == "safe-_.~");
    }

    SECTION("round trip") {
        std::string text = "ünïcode & spaces/slashes";
        REQUIRE(url_decode(url_encode(text)) == text);
    }
}

TEST_CASE("Request typed state", "[request]") {
    struct Counter {
        int hits = 0;
    };

    Request req;
    REQUIRE(req.find_state<Counter>() == nullptr);

    req.state<Counter>().hits++;
    req.state<Counter>().hits++;

    REQUIRE(req.find_state<Counter>() != nullptr);
    REQUIRE(req.find_state<Counter>()->hits == 2);

    req.clear_state<Counter>();
    REQUIRE(req.find_state<Counter>() == nullptr);
}

TEST_CASE("Request context", "[request]") {
    Request req;
    req.set_context("user", std::string("alice"));

    REQUIRE(req.has_context("user"));
    REQUIRE(req.get_context<std::string>("user") == "alice");
    REQUIRE(!req.get_context<int>("user"));
    REQUIRE(!req.get_context<std::string>("absent"));
}
