#include "veritas/store/user_store.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iostream>
#include <string_view>
#include <utility>

#include "veritas/assertion.hpp"
#include "veritas/core/platform_utils.hpp"
#include "store/store_state.hpp"

namespace veritas {

namespace {

using core::business_error;
using core::error_code;
using core::validation_error;

constexpr std::array<std::string_view, 6> kSortKeys{
    "id", "name", "age", "isActive", "createdAt", "updatedAt"};

auto log_line(std::string_view op, const std::string& text) -> void {
    if (core::log_enabled()) std::cerr << "[STORE][" << op << "] " << text << std::endl;
}

auto with_errors(const std::vector<field_error>& errors) -> value {
    value ctx = value::object();
    ctx["validationErrors"] = to_json(errors);
    return ctx;
}

auto generate_id(detail::store_state& s, core::timestamp at) -> std::string {
    static constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
    const auto millis = at.time_since_epoch().count();
    for (;;) {
        std::string id = s.config.id_prefix + std::to_string(millis) + "_";
        for (int i = 0; i < 9; ++i) id.push_back(kAlphabet[pick(s.rng)]);
        if (!s.users.contains(id)) return id;
    }
}

auto append_event(detail::store_state& s, AuditEvent event) -> void {
    const auto kind = to_string(kind_of(event));
    if (s.events.append(event) > 0) {
        log_line("events", "retention dropped oldest event, kept " + std::to_string(s.events.size()));
    }
    if (s.feed.append(std::move(event)) > 0) {
        log_line("feed", "retention dropped oldest event, kept " + std::to_string(s.feed.size()));
    }
    log_line("events", "appended " + std::string(kind));
}

auto check_id(const value& id) -> std::optional<core::app_error> {
    if (is_non_empty_string(id)) return std::nullopt;
    return validation_error{"id", "User ID must be a non-empty string", error_code::invalid_id};
}

// Caller holds the lock.
auto load_locked(const detail::store_state& s, const std::string& id) -> result<User> {
    auto it = s.users.find(id);
    if (it == s.users.end()) {
        return failure(business_error{error_code::not_found, "User with ID " + id + " not found", std::nullopt});
    }
    auto checked = validate_user(to_json(it->second.user));
    if (!checked) {
        log_line("read", "stored user " + id + " failed validation");
        value details = with_errors(checked.error());
        details["id"] = id;
        return failure(business_error{error_code::data_corruption, "Stored user data is corrupted",
                                      std::move(details)});
    }
    return success(std::move(*checked));
}

auto less_by(std::string_view key, const User& a, const User& b) -> bool {
    if (key == "id") return a.id < b.id;
    if (key == "name") return a.name < b.name;
    if (key == "age") return a.age < b.age;
    if (key == "isActive") return a.is_active < b.is_active;
    if (key == "createdAt") return a.created_at < b.created_at;
    return a.updated_at < b.updated_at;
}

auto pagination_error(std::string message) -> std::unexpected<failure_value> {
    return failure(validation_error{"pagination", std::move(message), error_code::invalid_pagination});
}

// Absent -> fallback; integer or numeric string -> its value; anything else -> nullopt.
auto query_integer(const value& query, const char* key, std::int64_t fallback)
    -> std::optional<std::int64_t> {
    auto it = query.find(key);
    if (it == query.end() || it->is_null()) return fallback;
    if (is_integer(*it)) return integer_value(*it);
    if (!it->is_string()) return std::nullopt;
    const auto text = trim(it->get_ref<const std::string&>());
    std::int64_t out = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (first == last || ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

auto collect_events(const store::AuditLog& log, std::optional<EventKind> kind)
    -> result<std::vector<AuditEvent>> {
    std::vector<AuditEvent> out;
    std::size_t excluded = 0;
    for (auto& e : log.newest_first()) {
        if (kind && kind_of(e) != *kind) continue;
        if (!validate_audit_event(to_json(e))) {
            ++excluded;
            continue;
        }
        out.push_back(std::move(e));
    }
    if (excluded > 0) log_line("events", "excluded " + std::to_string(excluded) + " corrupt events");
    return success(std::move(out), value{{"excluded", excluded}, {"trimmed", log.trimmed()}});
}

} // namespace

UserStore::UserStore(StoreConfig config, core::clock_fn clock)
    : state_(std::make_unique<detail::store_state>(std::move(config), std::move(clock))) {}

auto UserStore::open(StoreConfig config, core::clock_fn clock) -> std::expected<UserStore, core::error> {
    if (auto ok = validate_config(config); !ok) {
        log_line("open", ok.error().message);
        return std::unexpected(ok.error());
    }
    return UserStore(std::move(config), std::move(clock));
}

UserStore::~UserStore() = default;
UserStore::UserStore(UserStore&&) noexcept = default;
UserStore& UserStore::operator=(UserStore&&) noexcept = default;

auto UserStore::create(const value& input, CreationSource source) -> result<User> {
    if (!input.is_object()) {
        log_line("create", "rejected non-object input");
        return failure(validation_error{"userData", "Invalid user data", error_code::invalid_user_data},
                       with_errors(validate_user(input).error()));
    }
    std::lock_guard lock(state_->mutex);
    const auto at = state_->clock();
    const auto stamp = core::format_timestamp(at);

    value merged = input;
    merged["id"] = generate_id(*state_, at);
    merged["createdAt"] = stamp;
    merged["updatedAt"] = stamp;

    auto checked = validate_user(merged);
    if (!checked) {
        log_line("create", "rejected input with " + std::to_string(checked.error().size()) + " field errors");
        return failure(validation_error{"userData", "Invalid user data", error_code::invalid_user_data},
                       with_errors(checked.error()));
    }

    User user = std::move(*checked);
    state_->users.emplace(user.id, detail::stored_user{user, state_->next_seq++});
    append_event(*state_, AuditEvent{at, UserCreated{user, source, value{{"createdVia", "api"}}}});
    log_line("create", "stored " + user.id);
    return success(std::move(user));
}

auto UserStore::get_by_id(const value& id) const -> result<User> {
    if (auto bad = check_id(id)) return failure(std::move(*bad));
    std::lock_guard lock(state_->mutex);
    return load_locked(*state_, id.get<std::string>());
}

auto UserStore::list(const ListParams& params) const -> result<UserPage> {
    if (params.page < 1) return pagination_error("Page must be a positive integer");
    if (params.limit < 1 || static_cast<std::uint64_t>(params.limit) > state_->config.max_page_size) {
        return pagination_error("Limit must be between 1 and " + std::to_string(state_->config.max_page_size));
    }
    if (std::find(kSortKeys.begin(), kSortKeys.end(), params.sort_by) == kSortKeys.end()) {
        return failure(validation_error{"sortBy", "Invalid sort field: " + params.sort_by, error_code::invalid_sort});
    }
    if (params.sort_order != "asc" && params.sort_order != "desc") {
        return failure(validation_error{"sortOrder", "Sort order must be 'asc' or 'desc'", error_code::invalid_sort});
    }

    std::lock_guard lock(state_->mutex);
    std::vector<const detail::stored_user*> rows;
    rows.reserve(state_->users.size());
    std::size_t excluded = 0;
    for (const auto& [id, row] : state_->users) {
        if (!validate_user(to_json(row.user))) {
            ++excluded;
            continue;
        }
        rows.push_back(&row);
    }
    std::sort(rows.begin(), rows.end(), [](auto* a, auto* b) { return a->seq < b->seq; });

    const std::string_view key = params.sort_by;
    const bool ascending = params.sort_order == "asc";
    std::stable_sort(rows.begin(), rows.end(), [&](auto* a, auto* b) {
        return ascending ? less_by(key, a->user, b->user) : less_by(key, b->user, a->user);
    });

    UserPage page;
    page.total = rows.size();
    page.page = params.page;
    page.limit = params.limit;
    const auto limit = static_cast<std::uint64_t>(params.limit);
    const auto skip_pages = static_cast<std::uint64_t>(params.page - 1);
    page.pages = page.total == 0 ? 0 : static_cast<std::size_t>((page.total + limit - 1) / limit);

    std::size_t start = page.total;
    if (skip_pages <= page.total / limit) start = static_cast<std::size_t>(skip_pages * limit);
    const std::size_t end = start + static_cast<std::size_t>(std::min<std::uint64_t>(limit, page.total - start));
    for (std::size_t i = start; i < end; ++i) page.users.push_back(rows[i]->user);

    if (excluded > 0) log_line("list", "excluded " + std::to_string(excluded) + " corrupt users");
    return success(std::move(page), value{{"excluded", excluded}});
}

auto UserStore::list_from_query(const value& query) const -> result<UserPage> {
    const value q = query.is_null() ? value::object() : query;
    if (!q.is_object()) return pagination_error("Query must be an object");

    ListParams params;
    auto page = query_integer(q, "page", 1);
    if (!page) return pagination_error("Page must be a positive integer");
    auto limit = query_integer(q, "limit", static_cast<std::int64_t>(state_->config.default_page_size));
    if (!limit) return pagination_error("Limit must be a positive integer");
    params.page = *page;
    params.limit = *limit;

    if (auto it = q.find("sortBy"); it != q.end() && !it->is_null()) {
        if (!it->is_string()) {
            return failure(validation_error{"sortBy", "Sort field must be a string", error_code::invalid_sort});
        }
        params.sort_by = it->get<std::string>();
    }
    if (auto it = q.find("sortOrder"); it != q.end() && !it->is_null()) {
        if (!it->is_string()) {
            return failure(validation_error{"sortOrder", "Sort order must be 'asc' or 'desc'", error_code::invalid_sort});
        }
        params.sort_order = it->get<std::string>();
    }
    return list(params);
}

auto UserStore::update(const value& id, const value& partial) -> result<User> {
    if (auto bad = check_id(id)) return failure(std::move(*bad));
    std::lock_guard lock(state_->mutex);
    const auto key = id.get<std::string>();
    auto current = load_locked(*state_, key);
    if (!current) return forward_failure(current);

    if (!partial.is_object()) {
        return failure(validation_error{"updates", "Updates must be an object", error_code::invalid_updates});
    }

    const User& before = current->data;
    const value previous = to_json(before);
    value merged = previous;
    for (const auto& [k, v] : partial.items()) merged[k] = v;
    merged["id"] = before.id;
    merged["createdAt"] = previous.at("createdAt");
    const auto at = std::max(state_->clock(), before.created_at);
    merged["updatedAt"] = core::format_timestamp(at);

    auto checked = validate_user(merged);
    if (!checked) {
        log_line("update", "rejected update of " + key);
        return failure(validation_error{"updates", "Invalid updated user data", error_code::invalid_updated_data},
                       with_errors(checked.error()));
    }

    User user = std::move(*checked);
    state_->users.at(key).user = user;
    append_event(*state_, AuditEvent{at, UserUpdated{key, partial, previous, "api"}});
    return success(std::move(user));
}

auto UserStore::remove(const value& id) -> result<DeleteConfirmation> {
    if (auto bad = check_id(id)) return failure(std::move(*bad));
    std::lock_guard lock(state_->mutex);
    const auto key = id.get<std::string>();
    auto current = load_locked(*state_, key);
    if (!current) return forward_failure(current);

    state_->users.erase(key);
    append_event(*state_, AuditEvent{state_->clock(),
                                     UserDeleted{key, "api", std::string("API request"), std::move(current->data)}});
    log_line("remove", "removed " + key);
    return success(DeleteConfirmation{"User " + key + " deleted successfully"});
}

auto UserStore::list_events(const value& kind) const -> result<std::vector<AuditEvent>> {
    std::optional<EventKind> filter;
    if (!kind.is_null()) {
        if (kind.is_string()) filter = event_kind_from_string(kind.get_ref<const std::string&>());
        if (!filter) {
            return failure(validation_error{"type", "Unknown event type", error_code::invalid_event});
        }
    }
    std::lock_guard lock(state_->mutex);
    return collect_events(state_->events, filter);
}

auto UserStore::session_feed() const -> result<std::vector<AuditEvent>> {
    std::lock_guard lock(state_->mutex);
    return collect_events(state_->feed, std::nullopt);
}

auto UserStore::record_login_attempt(const value& attempt) -> result<AuditEvent> {
    auto payload = validate_event_payload(EventKind::login_attempt, attempt);
    if (!payload) {
        log_line("login", "rejected login attempt record");
        return failure(validation_error{"data", "Invalid login attempt", error_code::invalid_event},
                       with_errors(payload.error()));
    }
    std::lock_guard lock(state_->mutex);
    AuditEvent event{state_->clock(), std::move(*payload)};
    append_event(*state_, event);
    return success(std::move(event));
}

auto UserStore::restore(const User& user) -> result<User> {
    core::assert_is_user(to_json(user), "user");
    std::lock_guard lock(state_->mutex);
    if (state_->users.contains(user.id)) {
        return failure(business_error{error_code::duplicate_id, "User with ID " + user.id + " already exists",
                                      value{{"id", user.id}}});
    }
    state_->users.emplace(user.id, detail::stored_user{user, state_->next_seq++});
    append_event(*state_, AuditEvent{state_->clock(),
                                     UserCreated{user, CreationSource::imported, value{{"restored", true}}}});
    log_line("restore", "restored " + user.id);
    return success(user);
}

auto UserStore::size() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->users.size();
}

auto UserStore::event_count() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->events.size();
}

auto UserStore::config() const -> const StoreConfig& { return state_->config; }

auto UserStore::clear() -> void {
    std::lock_guard lock(state_->mutex);
    state_->users.clear();
    state_->events.clear();
    state_->feed.clear();
    state_->next_seq = 0;
}

auto to_json(const UserPage& page) -> value {
    value users = value::array();
    for (const auto& u : page.users) users.push_back(to_json(u));
    return value{{"users", std::move(users)},
                 {"pagination", {{"page", page.page}, {"limit", page.limit},
                                 {"total", page.total}, {"pages", page.pages}}}};
}

auto to_json(const DeleteConfirmation& c) -> value { return value{{"message", c.message}}; }

auto to_json(const std::vector<AuditEvent>& events) -> value {
    value out = value::array();
    for (const auto& e : events) out.push_back(to_json(e));
    return out;
}

} // namespace veritas
