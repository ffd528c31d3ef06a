#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "veritas/assertion.hpp"
#include "veritas/store/user_store.hpp"
#include "tests/support/store_probe.hpp"
#include "tests/support/test_clock.hpp"
#include "tests/support/user_fixtures.hpp"

using namespace veritas;
using core::error_code;
using core::error_kind;
using test_support::failure_code;
using test_support::failure_kind;
using test_support::user_input;

namespace {

UserStore make_store(StoreConfig cfg = {}) {
    return UserStore(std::move(cfg), test_support::stepping_clock(test_support::epoch_2024()));
}

std::vector<std::int64_t> ages_of(const UserPage& page) {
    std::vector<std::int64_t> out;
    for (const auto& u : page.users) out.push_back(u.age);
    return out;
}

} // namespace

TEST_CASE("create then read returns the same entity", "[store]") {
    auto store = make_store();
    auto created = store.create(user_input());
    REQUIRE(is_success(created));
    const User& u = created->data;
    REQUIRE(u.id.rfind("user_", 0) == 0);
    REQUIRE(u.id.size() == std::string("user_1704067200000_").size() + 9);
    REQUIRE(u.created_at == test_support::epoch_2024());
    REQUIRE(u.updated_at == u.created_at);
    REQUIRE(store.size() == 1);
    REQUIRE(store.event_count() == 1);

    auto read = store.get_by_id(value(u.id));
    REQUIRE(is_success(read));
    REQUIRE(read->data == u);
}

TEST_CASE("generated fields override caller-supplied ones", "[store]") {
    auto store = make_store();
    auto input = user_input();
    input["id"] = "mine";
    input["createdAt"] = "1999-01-01T00:00:00.000Z";
    auto created = store.create(input);
    REQUIRE(is_success(created));
    REQUIRE(created->data.id != "mine");
    REQUIRE(created->data.created_at == test_support::epoch_2024());
}

TEST_CASE("Ann lifecycle: create, update, remove, read", "[store][scenario]") {
    auto store = make_store();
    auto created = store.create(user_input("Ann", 30));
    REQUIRE(is_success(created));
    const auto id = value(created->data.id);

    auto updated = store.update(id, value{{"age", 31}});
    REQUIRE(is_success(updated));
    REQUIRE(updated->data.age == 31);
    REQUIRE(updated->data.id == created->data.id);
    REQUIRE(updated->data.created_at == created->data.created_at);
    REQUIRE(updated->data.updated_at > created->data.updated_at);

    auto removed = store.remove(id);
    REQUIRE(is_success(removed));
    REQUIRE(removed->data.message == "User " + created->data.id + " deleted successfully");

    auto gone = store.get_by_id(id);
    REQUIRE(is_failure(gone));
    REQUIRE(failure_kind(gone) == error_kind::business);
    REQUIRE(failure_code(gone) == error_code::not_found);
    REQUIRE(core::message_of(gone.error().error) == "User with ID " + created->data.id + " not found");
    REQUIRE(store.size() == 0);
    REQUIRE(store.event_count() == 3);
}

TEST_CASE("invalid create leaves store and log unchanged", "[store][scenario]") {
    auto store = make_store();
    auto r = store.create(user_input("Ann", -1));
    REQUIRE(is_failure(r));
    REQUIRE(failure_kind(r) == error_kind::validation);
    REQUIRE(failure_code(r) == error_code::invalid_user_data);
    const auto& errors = r.error().context->at("validationErrors");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0]["field"] == "age");
    REQUIRE(store.size() == 0);
    REQUIRE(store.event_count() == 0);

    auto not_object = store.create(value("Ann"));
    REQUIRE(is_failure(not_object));
    REQUIRE(std::get<core::validation_error>(not_object.error().error).field == "userData");
    REQUIRE(store.event_count() == 0);
}

TEST_CASE("malformed ids are validation errors", "[store]") {
    auto store = make_store();
    for (value bad : {value(42), value(""), value("   "), value(nullptr)}) {
        auto r = store.get_by_id(bad);
        REQUIRE(is_failure(r));
        REQUIRE(failure_kind(r) == error_kind::validation);
        REQUIRE(failure_code(r) == error_code::invalid_id);
    }
}

TEST_CASE("remove of a missing id changes nothing", "[store]") {
    auto store = make_store();
    REQUIRE(is_success(store.create(user_input())));
    auto r = store.remove(value("user_missing"));
    REQUIRE(is_failure(r));
    REQUIRE(failure_code(r) == error_code::not_found);
    REQUIRE(store.size() == 1);
    REQUIRE(store.event_count() == 1);
}

TEST_CASE("update never changes id or createdAt", "[store]") {
    auto store = make_store();
    auto created = store.create(user_input());
    REQUIRE(is_success(created));
    const auto id = value(created->data.id);

    auto r = store.update(id, value{{"id", "other"}, {"createdAt", "2000-01-01T00:00:00.000Z"}, {"name", "Anne"}});
    REQUIRE(is_success(r));
    REQUIRE(r->data.id == created->data.id);
    REQUIRE(r->data.created_at == created->data.created_at);
    REQUIRE(r->data.name == "Anne");
    REQUIRE(store.get_by_id(id)->data.name == "Anne");
}

TEST_CASE("update rejections", "[store]") {
    auto store = make_store();
    auto created = store.create(user_input());
    REQUIRE(is_success(created));
    const auto id = value(created->data.id);

    auto missing = store.update(value("user_missing"), value{{"age", 40}});
    REQUIRE(failure_code(missing) == error_code::not_found);

    auto not_object = store.update(id, value::array());
    REQUIRE(failure_code(not_object) == error_code::invalid_updates);

    auto invalid = store.update(id, value{{"age", 0}, {"tags", value::array({""})}});
    REQUIRE(failure_code(invalid) == error_code::invalid_updated_data);
    REQUIRE(invalid.error().context->at("validationErrors").size() == 2);

    REQUIRE(store.get_by_id(id)->data == created->data);
    REQUIRE(store.event_count() == 1);
}

TEST_CASE("pages concatenate to the sorted set", "[store][list]") {
    auto store = make_store();
    for (int age : {24, 20, 26, 21, 25, 23, 22}) {
        REQUIRE(is_success(store.create(user_input("u" + std::to_string(age), age))));
    }

    std::vector<std::int64_t> seen;
    for (std::int64_t page = 1; page <= 3; ++page) {
        auto r = store.list(ListParams{page, 3, "age", "asc"});
        REQUIRE(is_success(r));
        REQUIRE(r->data.total == 7);
        REQUIRE(r->data.pages == 3);
        REQUIRE(r->data.users.size() <= 3);
        for (auto a : ages_of(r->data)) seen.push_back(a);
    }
    REQUIRE(seen == std::vector<std::int64_t>{20, 21, 22, 23, 24, 25, 26});

    auto past_end = store.list(ListParams{4, 3, "age", "asc"});
    REQUIRE(is_success(past_end));
    REQUIRE(past_end->data.users.empty());
    REQUIRE(past_end->data.total == 7);

    auto huge = store.list(ListParams{std::numeric_limits<std::int64_t>::max(), 100, "age", "asc"});
    REQUIRE(is_success(huge));
    REQUIRE(huge->data.users.empty());

    auto desc = store.list(ListParams{1, 2, "age", "desc"});
    REQUIRE(ages_of(desc->data) == std::vector<std::int64_t>{26, 25});
}

TEST_CASE("default ordering is newest first, ties keep insertion order", "[store][list]") {
    auto store = make_store();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) ids.push_back(store.create(user_input("n" + std::to_string(i)))->data.id);

    auto newest = store.list(ListParams{});
    REQUIRE(is_success(newest));
    REQUIRE(newest->data.users.front().id == ids.back());
    REQUIRE(newest->data.users.back().id == ids.front());

    auto ties = store.list(ListParams{1, 10, "isActive", "desc"});
    REQUIRE(is_success(ties));
    for (std::size_t i = 0; i < ids.size(); ++i) REQUIRE(ties->data.users[i].id == ids[i]);
}

TEST_CASE("pagination and sort are rejected, never clamped", "[store][list]") {
    auto store = make_store();
    REQUIRE(failure_code(store.list(ListParams{0, 10, "createdAt", "desc"})) == error_code::invalid_pagination);
    REQUIRE(failure_code(store.list(ListParams{1, 0, "createdAt", "desc"})) == error_code::invalid_pagination);
    REQUIRE(failure_code(store.list(ListParams{1, 101, "createdAt", "desc"})) == error_code::invalid_pagination);
    REQUIRE(failure_code(store.list(ListParams{1, 10, "email", "desc"})) == error_code::invalid_sort);
    REQUIRE(failure_code(store.list(ListParams{1, 10, "name", "up"})) == error_code::invalid_sort);
    REQUIRE(is_success(store.list(ListParams{1, 100, "name", "asc"})));
}

TEST_CASE("list_from_query parses strings and applies defaults", "[store][list]") {
    auto store = make_store();
    for (int age = 20; age < 27; ++age) REQUIRE(is_success(store.create(user_input("q", age))));

    auto r = store.list_from_query(value{{"page", "2"}, {"limit", " 3 "}, {"sortBy", "age"}, {"sortOrder", "asc"}});
    REQUIRE(is_success(r));
    REQUIRE(ages_of(r->data) == std::vector<std::int64_t>{23, 24, 25});

    auto defaults = store.list_from_query(nullptr);
    REQUIRE(is_success(defaults));
    REQUIRE(defaults->data.limit == 10);
    REQUIRE(defaults->data.page == 1);
    REQUIRE(defaults->data.users.size() == 7);

    REQUIRE(failure_code(store.list_from_query(value{{"page", "abc"}})) == error_code::invalid_pagination);
    REQUIRE(failure_code(store.list_from_query(value{{"limit", 2.5}})) == error_code::invalid_pagination);
    REQUIRE(failure_code(store.list_from_query(value{{"sortBy", 3}})) == error_code::invalid_sort);
}

TEST_CASE("corrupt records are reported, never returned", "[store][corruption]") {
    auto store = make_store();
    auto good = store.create(user_input("good", 30));
    auto bad = store.create(user_input("bad", 31));
    REQUIRE(is_success(good));
    REQUIRE(is_success(bad));

    auto& state = detail::store_probe::state(store);
    state.users.at(bad->data.id).user.age = -5;

    auto read = store.get_by_id(value(bad->data.id));
    REQUIRE(is_failure(read));
    REQUIRE(failure_kind(read) == error_kind::business);
    REQUIRE(failure_code(read) == error_code::data_corruption);

    auto page = store.list(ListParams{});
    REQUIRE(is_success(page));
    REQUIRE(page->data.total == 1);
    REQUIRE(page->data.users.front().id == good->data.id);
    REQUIRE(page->metadata->at("excluded") == 1);

    REQUIRE(failure_code(store.update(value(bad->data.id), value{{"age", 32}})) == error_code::data_corruption);
    REQUIRE(failure_code(store.remove(value(bad->data.id))) == error_code::data_corruption);
    REQUIRE(store.size() == 2);
}

TEST_CASE("audit events are listed newest first and filterable", "[store][events]") {
    auto store = make_store();
    auto created = store.create(user_input());
    REQUIRE(is_success(created));
    REQUIRE(is_success(store.update(value(created->data.id), value{{"age", 31}})));
    auto login = store.record_login_attempt(value{
        {"userId", created->data.id}, {"ip", "10.0.0.1"}, {"userAgent", "curl/8"}, {"successful", true}});
    REQUIRE(is_success(login));

    auto all = store.list_events();
    REQUIRE(is_success(all));
    REQUIRE(all->data.size() == 3);
    REQUIRE(kind_of(all->data[0]) == EventKind::login_attempt);
    REQUIRE(kind_of(all->data[1]) == EventKind::updated);
    REQUIRE(kind_of(all->data[2]) == EventKind::created);
    REQUIRE(all->metadata->at("excluded") == 0);

    const auto& upd = std::get<UserUpdated>(all->data[1].payload);
    REQUIRE(upd.changes == value{{"age", 31}});
    REQUIRE(upd.previous_values["age"] == 30);
    REQUIRE(upd.updated_by == "api");

    const auto& made = std::get<UserCreated>(all->data[2].payload);
    REQUIRE(made.source == CreationSource::admin);
    REQUIRE(made.metadata->at("createdVia") == "api");

    auto only_created = store.list_events(value("created"));
    REQUIRE(only_created->data.size() == 1);

    REQUIRE(failure_code(store.list_events(value("exploded"))) == error_code::invalid_event);
    REQUIRE(failure_code(store.list_events(value(7))) == error_code::invalid_event);
}

TEST_CASE("corrupt audit events are excluded and counted", "[store][events][corruption]") {
    auto store = make_store();
    REQUIRE(is_success(store.create(user_input())));

    // An update whose changes is an array can only get into the log by corruption.
    detail::store_probe::state(store).events.append(
        AuditEvent{test_support::epoch_2024(), UserUpdated{"user_1", value::array(), value::object(), "api"}});

    auto all = store.list_events();
    REQUIRE(is_success(all));
    REQUIRE(all->data.size() == 1);
    for (const auto& e : all->data) REQUIRE(kind_of(e) == EventKind::created);
    REQUIRE(all->metadata->at("excluded") == 1);

    auto updates = store.list_events(value("updated"));
    REQUIRE(is_success(updates));
    REQUIRE(updates->data.empty());
    REQUIRE(updates->metadata->at("excluded") == 1);

    auto created = store.list_events(value("created"));
    REQUIRE(created->metadata->at("excluded") == 0);
}

TEST_CASE("invalid login attempts are not recorded", "[store][events]") {
    auto store = make_store();
    auto r = store.record_login_attempt(value{{"userId", "user_1"}, {"userAgent", "curl/8"}, {"successful", true}});
    REQUIRE(is_failure(r));
    REQUIRE(failure_code(r) == error_code::invalid_event);
    REQUIRE(r.error().context->at("validationErrors")[0]["field"] == "ip");
    REQUIRE(store.event_count() == 0);
}

TEST_CASE("event log and session feed apply their own retention", "[store][events]") {
    StoreConfig cfg;
    cfg.event_capacity = 3;
    cfg.feed_capacity = 2;
    auto store = make_store(cfg);
    for (int i = 0; i < 4; ++i) REQUIRE(is_success(store.create(user_input("r" + std::to_string(i)))));

    REQUIRE(store.event_count() == 3);
    auto events = store.list_events();
    REQUIRE(events->data.size() == 3);
    REQUIRE(events->metadata->at("trimmed") == 1);

    auto feed = store.session_feed();
    REQUIRE(is_success(feed));
    REQUIRE(feed->data.size() == 2);
    REQUIRE(std::get<UserCreated>(feed->data[0].payload).user.name == "r3");
}

TEST_CASE("deleted backups can be restored once", "[store][restore]") {
    auto store = make_store();
    auto created = store.create(user_input());
    REQUIRE(is_success(created));
    REQUIRE(is_success(store.remove(value(created->data.id))));

    auto deleted = store.list_events(value("deleted"));
    REQUIRE(deleted->data.size() == 1);
    const auto& payload = std::get<UserDeleted>(deleted->data[0].payload);
    REQUIRE(payload.reason == std::optional<std::string>{"API request"});
    REQUIRE(payload.backup == created->data);

    auto restored = store.restore(payload.backup);
    REQUIRE(is_success(restored));
    REQUIRE(store.get_by_id(value(created->data.id))->data == created->data);

    auto again = store.restore(payload.backup);
    REQUIRE(failure_code(again) == error_code::duplicate_id);

    auto imported = store.list_events(value("created"));
    REQUIRE(std::get<UserCreated>(imported->data[0].payload).source == CreationSource::imported);
}

TEST_CASE("restoring an invalid entity is a programming error", "[store][restore]") {
    auto store = make_store();
    User broken;
    broken.id = "user_x";
    REQUIRE_THROWS_AS(store.restore(broken), core::assertion_error);
    REQUIRE(store.size() == 0);
}

TEST_CASE("clear drops users and events", "[store]") {
    auto store = make_store();
    REQUIRE(is_success(store.create(user_input())));
    store.clear();
    REQUIRE(store.size() == 0);
    REQUIRE(store.event_count() == 0);
    REQUIRE(store.session_feed()->data.empty());
}

TEST_CASE("custom id prefix", "[store][config]") {
    StoreConfig cfg;
    cfg.id_prefix = "acct_";
    auto store = make_store(cfg);
    auto r = store.create(user_input());
    REQUIRE(r->data.id.rfind("acct_", 0) == 0);
    REQUIRE(store.config().id_prefix == "acct_");
}

TEST_CASE("open validates the config before constructing", "[store][config]") {
    StoreConfig cfg;
    cfg.default_page_size = 200;
    auto bad = UserStore::open(cfg);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == error_code::config_invalid);

    cfg = StoreConfig{};
    cfg.id_prefix.clear();
    REQUIRE_FALSE(UserStore::open(cfg).has_value());

    auto store = UserStore::open(StoreConfig{}, test_support::stepping_clock(test_support::epoch_2024()));
    REQUIRE(store.has_value());
    REQUIRE(is_success(store->create(user_input())));
    auto page = store->list_from_query(value(nullptr));
    REQUIRE(is_success(page));
    REQUIRE(page->data.limit == 10);
    REQUIRE(page->data.users.size() == 1);
}
