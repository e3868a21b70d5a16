/**
 * @file test_rule_registry.cpp
 * @brief Unit tests for rule registration and isolated dispatch
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "helpers/http_test_helpers.h"
#include "core/rule_registry.h"
#include "rules/cross_domain_misconfiguration.h"
#include <atomic>
#include <set>
#include <stdexcept>

using test_helpers::MockTransport;
using test_helpers::make_get;

namespace {

class ThrowingRule : public PassiveScanRule {
public:
    explicit ThrowingRule(int id) {
        meta_.id = id;
        meta_.name = "Throwing Rule";
    }

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override { return {}; }

    std::vector<Alert> inspect_response(const Transaction&) const override {
        throw std::runtime_error("boom");
    }

private:
    RuleMetadata meta_;
};

class CountingActiveRule : public ActiveScanRule {
public:
    CountingActiveRule(int id, std::vector<std::string> technologies, int& calls) : calls_(calls) {
        meta_.id = id;
        meta_.name = "Counting Rule";
        meta_.technologies = std::move(technologies);
    }

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override { return {}; }

    std::vector<Alert> scan(const Transaction& base, ScanContext&) const override {
        calls_++;
        Alert a;
        a.rule_id = meta_.id;
        a.uri = base.uri;
        return {a};
    }

private:
    RuleMetadata meta_;
    int& calls_;
};

} // namespace

static Transaction wildcard_cors() {
    return make_get("https://api.example.com/", "HTTP/1.1 200 OK\r\nAccess-Control-Allow-Origin: *\r\n\r\n");
}

TEST_CASE("Default rules", "[registry]") {
    RuleRegistry registry = RuleRegistry::with_default_rules();

    REQUIRE(registry.passive_rules().size() == 3);
    REQUIRE(registry.active_rules().size() == 2);
    REQUIRE(registry.passive_rules()[0]->id() == 10098);
    REQUIRE(registry.passive_rules()[1]->id() == 90002);
    REQUIRE(registry.passive_rules()[2]->id() == 10109);
    REQUIRE(registry.active_rules()[0]->id() == 10051);
    REQUIRE(registry.active_rules()[1]->id() == 20017);

    REQUIRE(registry.find(20017) != nullptr);
    REQUIRE(registry.find(20017)->name() == "Source Code Disclosure - CVE-2012-1823");
    REQUIRE(registry.find(12345) == nullptr);

    SECTION("Example alerts match their rule") {
        for (int id : {10098, 90002, 10109, 10051, 20017}) {
            const ScanRule* rule = registry.find(id);
            for (const auto& a : rule->example_alerts()) {
                REQUIRE(a.rule_id == id);
                REQUIRE(a.name == rule->name());
            }
        }
    }
}

TEST_CASE("Registration errors", "[registry]") {
    RuleRegistry registry;
    registry.add_passive(std::make_unique<CrossDomainMisconfigurationRule>());

    REQUIRE_THROWS_AS(registry.add_passive(std::make_unique<CrossDomainMisconfigurationRule>()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add_passive(std::unique_ptr<PassiveScanRule>()), std::invalid_argument);

    int calls = 0;
    REQUIRE_THROWS_AS(registry.add_active(std::make_unique<CountingActiveRule>(10098, std::vector<std::string>{}, calls)),
                      std::invalid_argument);
    REQUIRE(registry.passive_rules().size() == 1);
    REQUIRE(registry.active_rules().empty());
}

TEST_CASE("A failing rule does not stop its siblings", "[registry]") {
    RuleRegistry registry;
    registry.add_passive(std::make_unique<ThrowingRule>(1));
    registry.add_passive(std::make_unique<CrossDomainMisconfigurationRule>());

    std::vector<Alert> alerts;
    REQUIRE_NOTHROW(alerts = registry.run_passive_response(wildcard_cors()));
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].rule_id == 10098);

    REQUIRE(registry.run_passive_request(wildcard_cors()).empty());
}

TEST_CASE("Guarded call", "[registry]") {
    ThrowingRule rule(2);
    auto alerts = RuleRegistry::guarded(rule, []() -> std::vector<Alert> {
        throw std::logic_error("unexpected");
    });
    REQUIRE(alerts.empty());
}

TEST_CASE("Guarded call contains non-standard throws", "[registry]") {
    ThrowingRule rule(3);
    std::vector<Alert> alerts{Alert{}};
    REQUIRE_NOTHROW(alerts = RuleRegistry::guarded(rule, []() -> std::vector<Alert> {
        throw 42;
    }));
    REQUIRE(alerts.empty());

    REQUIRE_NOTHROW(alerts = RuleRegistry::guarded(rule, []() -> std::vector<Alert> {
        throw std::string("not an exception type");
    }));
    REQUIRE(alerts.empty());
}

TEST_CASE("Active dispatch honours technologies", "[registry]") {
    int php_calls = 0;
    int any_calls = 0;
    RuleRegistry registry;
    registry.add_active(std::make_unique<CountingActiveRule>(100, std::vector<std::string>{"Language.PHP"}, php_calls));
    registry.add_active(std::make_unique<CountingActiveRule>(101, std::vector<std::string>{}, any_calls));

    MockTransport transport;
    ScanContext ctx(transport);
    Transaction base = make_get("http://www.example.com/index.jsp", "HTTP/1.1 200 OK\r\n\r\n");

    auto alerts = registry.run_active(base, ctx, TechSet(std::set<std::string>{"Language.Java"}));
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].rule_id == 101);
    REQUIRE(php_calls == 0);

    alerts = registry.run_active(base, ctx, TechSet::all());
    REQUIRE(alerts.size() == 2);
    REQUIRE(php_calls == 1);
    REQUIRE(any_calls == 2);

    SECTION("Stopped context runs nothing") {
        std::atomic<bool> stop{true};
        ScanContext stopped(transport, AttackStrength::MEDIUM, AlertThreshold::MEDIUM, &stop);
        REQUIRE(registry.run_active(base, stopped, TechSet::all()).empty());
        REQUIRE(any_calls == 2);
    }
}
