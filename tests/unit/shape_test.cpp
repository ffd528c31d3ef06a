#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

#include "veritas/shape.hpp"
#include "tests/support/test_clock.hpp"
#include "tests/support/user_fixtures.hpp"

using namespace veritas;
using test_support::valid_user_json;

TEST_CASE("valid user narrows in both modes", "[shape]") {
    auto j = valid_user_json();
    REQUIRE(is_user(j));
    auto u = validate_user(j);
    REQUIRE(u.has_value());
    REQUIRE(u->id == "user_1");
    REQUIRE(u->name == "Ann");
    REQUIRE(u->contact.email == "ann@example.com");
    REQUIRE_FALSE(u->contact.phone.has_value());
    REQUIRE(u->age == 30);
    REQUIRE(u->is_active);
    REQUIRE(u->tags == std::vector<std::string>{"dev"});
    REQUIRE(u->created_at == test_support::epoch_2024());
}

TEST_CASE("missing required field yields exactly one presence error", "[shape]") {
    for (const auto& rule : user_shape()) {
        if (!rule.required) continue;
        const std::string name(rule.name);
        DYNAMIC_SECTION("without " << name) {
            auto j = valid_user_json();
            j.erase(name);
            REQUIRE_FALSE(is_user(j));
            auto r = validate_user(j);
            REQUIRE_FALSE(r.has_value());
            REQUIRE(r.error().size() == 1);
            REQUIRE(r.error()[0].field == name);
            REQUIRE(r.error()[0].message == "Missing or invalid " + name + " field");
            REQUIRE(r.error()[0].received.is_null());
        }
    }
}

TEST_CASE("every failing field is reported in declaration order", "[shape]") {
    auto j = valid_user_json();
    j["name"] = "   ";
    j["age"] = -1;
    j["tags"] = {"ok", ""};
    auto r = validate_user(j);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().size() == 3);
    REQUIRE(r.error()[0].field == "name");
    REQUIRE(r.error()[1].field == "age");
    REQUIRE(r.error()[1].message == "Age must be a positive integer");
    REQUIRE(r.error()[1].received == -1);
    REQUIRE(r.error()[2].field == "tags");
}

TEST_CASE("non-integer and non-number ages are rejected", "[shape]") {
    for (value bad : {value(0), value(30.5), value("30"), value(nullptr)}) {
        auto j = valid_user_json();
        j["age"] = bad;
        auto r = validate_user(j);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().size() == 1);
        REQUIRE(r.error()[0].field == "age");
    }
}

TEST_CASE("nested contact errors are attached to the parent field", "[shape]") {
    auto j = valid_user_json();
    j["contact"] = {{"email", "not-an-email"}, {"phone", "123"}};
    auto r = validate_user(j);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().size() == 1);
    const auto& e = r.error()[0];
    REQUIRE(e.field == "contact");
    REQUIRE(e.message == "contact must be a valid contact record");
    REQUIRE(e.received["received"] == j["contact"]);
    REQUIRE(e.received["errors"].size() == 2);
    REQUIRE(e.received["errors"][0]["field"] == "email");
    REQUIRE(e.received["errors"][1]["field"] == "phone");
}

TEST_CASE("contact with address narrows", "[shape]") {
    value contact = {
        {"email", "ann@example.com"},
        {"phone", "+1 555 123 4567"},
        {"address", {{"street", "1 Main St"}, {"city", "Springfield"}, {"state", "IL"},
                     {"zipCode", "62701"}, {"country", "US"}}},
    };
    auto c = validate_contact_info(contact);
    REQUIRE(c.has_value());
    REQUIRE(c->phone == std::optional<std::string>{"+1 555 123 4567"});
    REQUIRE(c->address->zip_code == "62701");
    REQUIRE(to_json(*c) == contact);

    contact["address"].erase("city");
    auto bad = validate_contact_info(contact);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error()[0].field == "address");
    REQUIRE(bad.error()[0].received["errors"][0]["message"] == "Missing or invalid city field");
}

TEST_CASE("non-object input reports root", "[shape]") {
    for (value v : {value(nullptr), value(42), value("user"), value::array()}) {
        auto r = validate_user(v);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().size() == 1);
        REQUIRE(r.error()[0].field == "root");
        REQUIRE(r.error()[0].message == "Value is not an object");
    }
}

TEST_CASE("metadata is optional but must be an object", "[shape]") {
    auto j = valid_user_json();
    j["metadata"] = {{"plan", "pro"}};
    auto u = validate_user(j);
    REQUIRE(u.has_value());
    REQUIRE(u->metadata->at("plan") == "pro");

    j["metadata"] = "pro";
    auto r = validate_user(j);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error()[0].message == "metadata must be a plain object");
}

TEST_CASE("unknown keys are dropped by narrowing", "[shape]") {
    auto j = valid_user_json();
    j["password"] = "hunter2";
    auto u = validate_user(j);
    REQUIRE(u.has_value());
    auto out = to_json(*u);
    REQUIRE_FALSE(out.contains("password"));
    REQUIRE(out == valid_user_json());
}

TEST_CASE("detailed validation is idempotent", "[shape]") {
    auto j = valid_user_json();
    j["age"] = "old";
    j.erase("tags");
    auto first = validate_user(j);
    auto second = validate_user(j);
    REQUIRE_FALSE(first.has_value());
    REQUIRE_FALSE(second.has_value());
    REQUIRE(to_json(first.error()) == to_json(second.error()));
    REQUIRE(is_user(j) == first.has_value());
}

TEST_CASE("accepted users re-validate after serialization at the calendar edges", "[shape]") {
    for (const char* stamp : {"0000-01-01T00:30:00.000+01:00", "9999-12-31T23:30:00.000-01:00"}) {
        auto j = valid_user_json();
        j["createdAt"] = stamp;
        j["updatedAt"] = stamp;
        auto first = validate_user(j);
        REQUIRE_FALSE(first.has_value());
        REQUIRE(first.error().size() == 2);
    }
    for (const char* stamp : {"0000-01-01T01:30:00.000+01:00", "9999-12-31T22:30:00.000-01:00"}) {
        auto j = valid_user_json();
        j["createdAt"] = stamp;
        j["updatedAt"] = stamp;
        auto first = validate_user(j);
        REQUIRE(first.has_value());
        auto second = validate_user(to_json(*first));
        REQUIRE(second.has_value());
        REQUIRE(*second == *first);
    }
}

namespace {

value admin_json() {
    auto j = valid_user_json();
    j["role"] = "admin";
    j["permissions"] = {"users:read", "users:write"};
    j["lastLogin"] = "2024-01-01T00:00:00.000Z";
    return j;
}

value regular_json() {
    auto j = valid_user_json();
    j["role"] = "user";
    j["subscription"] = "premium";
    return j;
}

} // namespace

TEST_CASE("admin users extend the user shape", "[shape][roles]") {
    auto j = admin_json();
    REQUIRE(is_admin_user(j));
    REQUIRE(is_user(j));
    auto a = validate_admin_user(j);
    REQUIRE(a.has_value());
    REQUIRE(a->user.id == "user_1");
    REQUIRE(a->permissions == std::vector<std::string>{"users:read", "users:write"});
    REQUIRE(a->last_login == std::optional{test_support::epoch_2024()});
    REQUIRE(to_json(*a) == j);

    j.erase("lastLogin");
    auto without_login = validate_admin_user(j);
    REQUIRE(without_login.has_value());
    REQUIRE_FALSE(without_login->last_login.has_value());
    REQUIRE_FALSE(to_json(*without_login).contains("lastLogin"));
}

TEST_CASE("admin role and permissions are checked", "[shape][roles]") {
    auto j = admin_json();
    j.erase("role");
    auto missing = validate_admin_user(j);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().size() == 1);
    REQUIRE(missing.error()[0].message == "Missing or invalid role field");

    j = admin_json();
    j["role"] = "user";
    REQUIRE_FALSE(is_admin_user(j));
    auto wrong_role = validate_admin_user(j);
    REQUIRE_FALSE(wrong_role.has_value());
    REQUIRE(wrong_role.error()[0].field == "role");
    REQUIRE(wrong_role.error()[0].message == "role must be \"admin\"");
    REQUIRE(wrong_role.error()[0].received == "user");

    j = admin_json();
    j["permissions"] = {"users:read", 7};
    j["lastLogin"] = "yesterday";
    auto bad = validate_admin_user(j);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().size() == 2);
    REQUIRE(bad.error()[0].field == "permissions");
    REQUIRE(bad.error()[1].field == "lastLogin");
}

TEST_CASE("base and role errors are reported together", "[shape][roles]") {
    auto j = admin_json();
    j["age"] = 0;
    j.erase("permissions");
    auto r = validate_admin_user(j);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().size() == 2);
    REQUIRE(r.error()[0].field == "age");
    REQUIRE(r.error()[1].field == "permissions");
    REQUIRE(r.error()[1].message == "Missing or invalid permissions field");
}

TEST_CASE("regular users carry an optional subscription", "[shape][roles]") {
    auto j = regular_json();
    REQUIRE(is_regular_user(j));
    auto r = validate_regular_user(j);
    REQUIRE(r.has_value());
    REQUIRE(r->subscription == std::optional{Subscription::premium});
    REQUIRE(to_json(*r) == j);

    j.erase("subscription");
    auto plain = validate_regular_user(j);
    REQUIRE(plain.has_value());
    REQUIRE_FALSE(plain->subscription.has_value());

    j["subscription"] = "gold";
    REQUIRE_FALSE(is_regular_user(j));
    auto gold = validate_regular_user(j);
    REQUIRE_FALSE(gold.has_value());
    REQUIRE(gold.error().size() == 1);
    REQUIRE(gold.error()[0].message == "subscription must be one of basic, premium, enterprise");
}

TEST_CASE("role variants do not overlap", "[shape][roles]") {
    REQUIRE_FALSE(is_regular_user(admin_json()));
    REQUIRE_FALSE(is_admin_user(regular_json()));
    REQUIRE_FALSE(is_admin_user(valid_user_json()));
    REQUIRE(to_string(Subscription::enterprise) == "enterprise");
    REQUIRE(subscription_from_string("basic") == std::optional{Subscription::basic});
    REQUIRE_FALSE(subscription_from_string("Basic").has_value());
}
