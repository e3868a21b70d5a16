/**
 * @file test_source_code_disclosure.cpp
 * @brief Unit tests for PHP source disclosure through CVE-2012-1823
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "helpers/http_test_helpers.h"
#include "rules/source_code_disclosure_cve_2012_1823.h"
#include <set>

using test_helpers::MockTransport;
using test_helpers::make_get;

static const std::string PAGE_URL = "http://php.example.com/app/info.php";

static Transaction base_page(const std::string& raw_response =
                                 "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n<html><body>Hello</body></html>") {
    return make_get(PAGE_URL, raw_response);
}

static const std::string LEAKED =
    "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n"
    "<code><span>&lt;?php $db_pass = 'hunter2'; echo 'Hello'; ?&gt;</span></code>";

TEST_CASE("PHP source matching", "[cve_2012_1823]") {
    using Rule = SourceCodeDisclosureCve20121823Rule;

    REQUIRE(Rule::find_php_source("<?php echo 1; ?>") == "<?php echo 1; ?>");
    REQUIRE(Rule::find_php_source("x &lt;?php\n$a = 1;\n?&gt; y") == "<?php\n$a = 1;\n?>");
    REQUIRE(Rule::find_php_source("<p><?= $title ?></p>") == "<?= $title ?>");
    REQUIRE(Rule::find_php_source("<html><body>plain</body></html>").empty());
    REQUIRE(Rule::find_php_source("<?xml version=\"1.0\"?>").empty());

    SECTION("Block needs a statement before the closing tag") {
        REQUIRE(Rule::find_php_source("<?php ?> text").empty());
        REQUIRE(Rule::find_php_source("<?php;?>").empty());
        REQUIRE(Rule::find_php_source("<?php header('x') ?> then $a = 1; ?>") ==
                "<?php header('x') ?> then $a = 1; ?>");
        REQUIRE(Rule::find_php_source("<?=?>").empty());
    }

    SECTION("Large pages") {
        std::string block = "<?php " + std::string(100000, 'a') + "; ?>";
        REQUIRE(Rule::find_php_source(block) == block);
        std::string echo = "<?= " + std::string(100000, 'b') + " ?>";
        REQUIRE(Rule::find_php_source("<p>" + echo + "</p>") == echo);
        REQUIRE(Rule::find_php_source("<?php " + std::string(100000, 'c')).empty());
    }
}

TEST_CASE("Only PHP targets are probed", "[cve_2012_1823]") {
    SourceCodeDisclosureCve20121823Rule rule;
    REQUIRE(rule.applicable(TechSet::all()));
    REQUIRE(rule.applicable(TechSet(std::set<std::string>{"Language.PHP"})));
    REQUIRE(rule.applicable(TechSet(std::set<std::string>{"Language"})));
    REQUIRE_FALSE(rule.applicable(TechSet(std::set<std::string>{"Language.Java"})));
    REQUIRE_FALSE(rule.applicable(TechSet()));
}

TEST_CASE("Disclosed source raises a High alert", "[cve_2012_1823]") {
    SourceCodeDisclosureCve20121823Rule rule;
    MockTransport transport;
    transport.respond_with(LEAKED);
    ScanContext ctx(transport);

    auto alerts = rule.scan(base_page(), ctx);
    REQUIRE(alerts.size() == 1);

    const Alert& a = alerts[0];
    REQUIRE(a.rule_id == 20017);
    REQUIRE(a.risk == Risk::HIGH);
    REQUIRE(a.confidence == Confidence::MEDIUM);
    REQUIRE(a.other_info == "<?php $db_pass = 'hunter2'; echo 'Hello'; ?>");
    REQUIRE(a.evidence.empty());
    REQUIRE(a.attack.empty());
    REQUIRE(a.uri == PAGE_URL);
    REQUIRE(a.tags.count("CVE-2012-1823") == 1);

    REQUIRE(transport.requests().size() == 1);
    REQUIRE(transport.requests()[0].uri == PAGE_URL + "?-s");
    REQUIRE_FALSE(transport.redirect_flags()[0]);
}

TEST_CASE("Probe is skipped or ignored", "[cve_2012_1823]") {
    SourceCodeDisclosureCve20121823Rule rule;
    MockTransport transport;
    transport.respond_with(LEAKED);

    SECTION("Base page already shows PHP") {
        ScanContext ctx(transport);
        Transaction base = base_page("HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n"
                                     "<pre>&lt;?php echo 'tutorial'; ?&gt;</pre>");
        REQUIRE(rule.scan(base, ctx).empty());
        REQUIRE(transport.requests().empty());
    }

    SECTION("Binary content type") {
        ScanContext ctx(transport);
        Transaction base = base_page("HTTP/1.1 200 OK\r\nContent-Type: image/png\r\n\r\nPNG");
        REQUIRE(rule.scan(base, ctx).empty());
        REQUIRE(transport.requests().empty());
    }

    SECTION("Binary body") {
        ScanContext ctx(transport);
        Transaction base = base_page(std::string("HTTP/1.1 200 OK\r\n\r\n\x89PNG\x01\x02", 25));
        REQUIRE(rule.scan(base, ctx).empty());
        REQUIRE(transport.requests().empty());
    }

    SECTION("Not found at medium strength") {
        ScanContext ctx(transport, AttackStrength::MEDIUM);
        Transaction base = base_page("HTTP/1.1 404 Not Found\r\nContent-Type: text/html\r\n\r\nmissing");
        REQUIRE(rule.scan(base, ctx).empty());
        REQUIRE(transport.requests().empty());
    }

    SECTION("Not found at high strength is probed") {
        ScanContext ctx(transport, AttackStrength::HIGH);
        Transaction base = base_page("HTTP/1.1 404 Not Found\r\nContent-Type: text/html\r\n\r\nmissing");
        REQUIRE(rule.scan(base, ctx).size() == 1);
    }

    SECTION("Probe answered with an error status") {
        MockTransport failing;
        failing.respond_with("HTTP/1.1 500 Internal Server Error\r\nContent-Type: text/html\r\n\r\n"
                             "&lt;?php echo 1; ?&gt;");
        ScanContext ctx(failing);
        REQUIRE(rule.scan(base_page(), ctx).empty());
    }

    SECTION("Transport failure") {
        transport.set_fail(true);
        ScanContext ctx(transport);
        REQUIRE(rule.scan(base_page(), ctx).empty());
    }
}

TEST_CASE("JavaScript responses need a low threshold", "[cve_2012_1823]") {
    SourceCodeDisclosureCve20121823Rule rule;
    MockTransport transport;
    transport.respond_with("HTTP/1.1 200 OK\r\nContent-Type: application/javascript\r\n\r\n"
                           "var tpl = \"<?php echo $x; ?>\";");

    SECTION("Medium threshold") {
        ScanContext ctx(transport, AttackStrength::MEDIUM, AlertThreshold::MEDIUM);
        REQUIRE(rule.scan(base_page(), ctx).empty());
    }

    SECTION("Low threshold") {
        ScanContext ctx(transport, AttackStrength::MEDIUM, AlertThreshold::LOW);
        auto alerts = rule.scan(base_page(), ctx);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].other_info == "<?php echo $x; ?>");
    }
}
