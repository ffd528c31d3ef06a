/**
 * User store walkthrough using Veritas
 *
 * This example demonstrates:
 * - Loading store configuration from the environment
 * - Creating users from raw JSON and from a string-typed form
 * - Handling classified failures through the response envelope
 * - Paginated listing and the audit trail
 */

#include <veritas/api/envelope.hpp>
#include <veritas/config.hpp>
#include <veritas/error_mapping.hpp>
#include <veritas/form.hpp>
#include <veritas/store/user_store.hpp>
#include <iostream>
#include <utility>

namespace {

void print(const char* label, const veritas::value& envelope) {
    std::cout << "== " << label << "\n" << envelope.dump(2) << "\n";
}

} // namespace

int main() {
    using namespace veritas;

    auto cfg = load_config_from_env();
    if (!cfg) {
        std::cerr << "Invalid configuration: " << cfg.error().message << std::endl;
        return 1;
    }
    auto opened = UserStore::open(*cfg);
    if (!opened) {
        std::cerr << "Cannot open store: " << opened.error().message << std::endl;
        return 1;
    }
    UserStore store = std::move(*opened);

    // Raw JSON input
    auto ann = store.create(value{
        {"name", "Ann"},
        {"contact", {{"email", "ann@example.com"}, {"phone", "+1 (555) 123-4567"}}},
        {"age", 30},
        {"isActive", true},
        {"tags", {"admin", "ops"}},
    });
    print("create Ann", api::to_envelope(ann));

    // Form input: every field arrives as text
    auto form = validate_user_form(value{
        {"name", "Bob"}, {"email", "bob@example.com"}, {"age", "42"}, {"tags", "dev, qa"}, {"isActive", false}});
    if (form) {
        print("create Bob", api::to_envelope(store.create(*form, CreationSource::registration)));
    }

    // Rejected input reports every failing field
    auto bad = store.create(value{{"name", ""}, {"contact", {{"email", "nope"}}}, {"age", -1}});
    print("rejected create", api::to_envelope(bad));
    std::cout << "status " << core::http_status(bad.error().error) << "\n";

    if (ann) {
        const value id = ann->data.id;
        print("update Ann", api::to_envelope(store.update(id, value{{"age", 31}})));
        auto login = store.record_login_attempt(value{{"userId", ann->data.id}, {"ip", "10.0.0.1"},
                                                      {"userAgent", "demo"}, {"successful", true}});
        print("login attempt", api::to_envelope(login));
    }

    print("list", api::to_envelope(store.list_from_query(value{{"sortBy", "name"}, {"sortOrder", "asc"}})));
    print("events", api::to_envelope(store.list_events()));

    auto missing = store.get_by_id(value("user_missing"));
    print("missing user", api::to_envelope(missing));
    std::cout << "status " << core::http_status(missing.error().error) << "\n";
    return 0;
}
