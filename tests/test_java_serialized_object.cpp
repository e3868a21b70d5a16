/**
 * @file test_java_serialized_object.cpp
 * @brief Unit tests for Java serialization stream detection
 *
 * Covers the raw, base64 and percent-encoded forms of the stream magic in
 * headers, cookies, URL and form parameters and bodies.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "helpers/http_test_helpers.h"
#include "rules/java_serialized_object.h"
#include "core/http_message.h"
#include <string>

using test_helpers::make_transaction;

static const std::string RAW_STREAM("\xAC\xED\x00\x05sr\x00\x11java.util.HashMap", 25);
static const std::string B64_STREAM = "rO0ABXNyABFqYXZhLnV0aWwuSGFzaE1hcA==";

static const std::string OK_RESPONSE = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nok";

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string request_with(const std::string& extra_headers, const std::string& body = "") {
    return "POST http://shop.example.com/cart HTTP/1.1\r\n"
           "Host: shop.example.com\r\n" + extra_headers + "\r\n" + body;
}

TEST_CASE("Candidate decoding", "[jso]") {
    SECTION("Raw magic") {
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object(RAW_STREAM));
    }

    SECTION("Base64") {
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object(B64_STREAM));
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object("rO0ABXNy"));
    }

    SECTION("Base64 without padding") {
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object("rO0ABQ"));
    }

    SECTION("Percent-encoded bytes") {
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object("%AC%ED%00%05sr"));
    }

    SECTION("Percent-encoded UTF-8") {
        REQUIRE(JavaSerializedObjectRule::carries_serialized_object("%C2%AC%C3%AD%00%05sr"));
    }

    SECTION("Ordinary values") {
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object("text/html; charset=utf-8"));
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object("eyJhbGciOiJIUzI1NiJ9"));
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object(""));
    }

    SECTION("Malformed encodings are non-matches") {
        REQUIRE_NOTHROW(JavaSerializedObjectRule::carries_serialized_object("%ZZ%AC%E"));
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object("%ZZ%AC%E"));
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object("r"));
        REQUIRE_FALSE(JavaSerializedObjectRule::carries_serialized_object("!!!==="));
    }
}

TEST_CASE("Request channels", "[jso]") {
    JavaSerializedObjectRule rule;

    SECTION("Header") {
        Transaction tx = make_transaction(request_with("X-State: " + B64_STREAM + "\r\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].rule_id == 90002);
        REQUIRE(alerts[0].param == "X-State");
        REQUIRE(alerts[0].evidence == B64_STREAM);
        REQUIRE(alerts[0].risk == Risk::MEDIUM);
        REQUIRE(alerts[0].confidence == Confidence::HIGH);
        REQUIRE(http::request_header_block(tx).find(alerts[0].evidence) != std::string::npos);
    }

    SECTION("Cookie") {
        Transaction tx = make_transaction(request_with("Cookie: theme=dark; session=rO0ABXNy\r\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "session");
        REQUIRE(alerts[0].evidence == "rO0ABXNy");
    }

    SECTION("URL parameter") {
        Transaction tx = make_transaction(
            "GET http://shop.example.com/load?id=7&obj=%AC%ED%00%05sr HTTP/1.1\r\nHost: shop.example.com\r\n\r\n",
            OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "obj");
        REQUIRE(alerts[0].evidence == "%AC%ED%00%05sr");
        REQUIRE(alerts[0].uri == tx.uri);
    }

    SECTION("Form parameter") {
        Transaction tx = make_transaction(
            request_with("Content-Type: application/x-www-form-urlencoded\r\n", "qty=1&cart=rO0ABXNy"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "cart");
    }

    SECTION("Raw body") {
        Transaction tx = make_transaction(
            request_with("Content-Type: application/x-java-serialized-object\r\n", RAW_STREAM), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param.empty());
        REQUIRE(alerts[0].evidence.empty());
    }

    SECTION("Base64 body") {
        Transaction tx = make_transaction(
            request_with("Content-Type: text/plain\r\n", B64_STREAM + "\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].evidence == B64_STREAM);
        REQUIRE(tx.request_body.find(alerts[0].evidence) != std::string::npos);
    }

    SECTION("Raw bytes in a header") {
        Transaction tx = make_transaction(request_with("X-Blob: " + RAW_STREAM + "\r\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "X-Blob");
        REQUIRE(alerts[0].evidence == RAW_STREAM);
        REQUIRE(contains(http::request_header_block(tx), alerts[0].evidence));
    }

    SECTION("Percent-encoded header") {
        Transaction tx = make_transaction(request_with("X-State: %AC%ED%00%05sr\r\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "X-State");
        REQUIRE(alerts[0].evidence == "%AC%ED%00%05sr");
        REQUIRE(contains(http::request_header_block(tx), alerts[0].evidence));
    }

    SECTION("Percent-encoded cookie") {
        Transaction tx = make_transaction(request_with("Cookie: lang=en; jso=%C2%AC%C3%AD%00%05sr\r\n"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "jso");
        REQUIRE(alerts[0].evidence == "%C2%AC%C3%AD%00%05sr");
        REQUIRE(contains(http::request_header_block(tx), alerts[0].evidence));
    }

    SECTION("Base64 URL parameter") {
        Transaction tx = make_transaction(
            "GET http://shop.example.com/load?obj=rO0ABXNy&page=2 HTTP/1.1\r\nHost: shop.example.com\r\n\r\n",
            OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "obj");
        REQUIRE(alerts[0].evidence == "rO0ABXNy");
        REQUIRE(contains(tx.uri, alerts[0].evidence));
    }

    SECTION("Percent-encoded body") {
        Transaction tx = make_transaction(
            request_with("Content-Type: text/plain\r\n", "%AC%ED%00%05sr"), OK_RESPONSE);
        auto alerts = rule.inspect_request(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param.empty());
        REQUIRE(alerts[0].evidence == "%AC%ED%00%05sr");
        REQUIRE(contains(tx.request_body, alerts[0].evidence));
    }

    SECTION("Nothing to find") {
        Transaction tx = make_transaction(
            request_with("Cookie: a=1\r\nContent-Type: application/json\r\n", "{\"q\":\"shoes\"}"), OK_RESPONSE);
        REQUIRE(rule.inspect_request(tx).empty());
    }
}

TEST_CASE("One alert per message, first channel wins", "[jso]") {
    JavaSerializedObjectRule rule;
    Transaction tx = make_transaction(
        request_with("X-State: rO0ABXNy\r\nCookie: session=rO0ABXNy\r\n", RAW_STREAM), OK_RESPONSE);

    auto alerts = rule.inspect_request(tx);
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].param == "X-State");
}

TEST_CASE("Malformed channels do not hide later ones", "[jso]") {
    JavaSerializedObjectRule rule;
    Transaction tx = make_transaction(
        "GET http://shop.example.com/load?bad=%ZZ&obj=rO0ABXNy HTTP/1.1\r\nHost: shop.example.com\r\n\r\n",
        OK_RESPONSE);

    auto alerts = rule.inspect_request(tx);
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].param == "obj");
}

TEST_CASE("Response channels", "[jso]") {
    JavaSerializedObjectRule rule;
    const std::string req = "GET http://shop.example.com/ HTTP/1.1\r\nHost: shop.example.com\r\n\r\n";

    SECTION("Header") {
        Transaction tx = make_transaction(req, "HTTP/1.1 200 OK\r\nX-View-State: rO0ABXNy\r\n\r\n");
        auto alerts = rule.inspect_response(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "X-View-State");
    }

    SECTION("Set-Cookie") {
        Transaction tx = make_transaction(req, "HTTP/1.1 200 OK\r\nSet-Cookie: state=rO0ABXNy; Path=/; HttpOnly\r\n\r\n");
        auto alerts = rule.inspect_response(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "state");
        REQUIRE(alerts[0].evidence == "rO0ABXNy");
    }

    SECTION("Body") {
        Transaction tx = make_transaction(req,
            "HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\n\r\n" + RAW_STREAM);
        REQUIRE(rule.inspect_response(tx).size() == 1);
    }

    SECTION("Percent-encoded Set-Cookie") {
        Transaction tx = make_transaction(req, "HTTP/1.1 200 OK\r\nSet-Cookie: state=%AC%ED%00%05sr; Path=/\r\n\r\n");
        auto alerts = rule.inspect_response(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].param == "state");
        REQUIRE(alerts[0].evidence == "%AC%ED%00%05sr");
        REQUIRE(contains(http::response_header_block(tx), alerts[0].evidence));
    }

    SECTION("Base64 body") {
        Transaction tx = make_transaction(req, "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\n" + B64_STREAM);
        auto alerts = rule.inspect_response(tx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].evidence == B64_STREAM);
        REQUIRE(contains(tx.response_body, alerts[0].evidence));
    }

    SECTION("Plain HTML") {
        Transaction tx = make_transaction(req,
            "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n<html><body>hello</body></html>");
        REQUIRE(rule.inspect_response(tx).empty());
    }
}
