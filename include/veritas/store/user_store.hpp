#pragma once

/** \file user_store.hpp
 *  \brief In-memory store of validated users with an audit trail.
 *
 * Every operation accepts untyped input, narrows it, and returns a result<T>. Nothing is
 * stored unless it passed detailed validation; a failing operation leaves the user table and
 * both event logs unchanged.
 *
 * Reads re-validate stored data. A single-entity read of a corrupt record fails with
 * business/DATA_CORRUPTION; collection reads leave corrupt records out and report how many
 * were left out as metadata {"excluded": n}.
 *
 * Thread-safety: every public operation holds one exclusive lock for its whole
 * read-modify-write sequence, so no reader observes a partially applied write.
 * Values handed out are copies; mutating them never affects the store.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "veritas/audit_event.hpp"
#include "veritas/config.hpp"
#include "veritas/core/timestamp.hpp"
#include "veritas/result.hpp"
#include "veritas/shape.hpp"

namespace veritas {

namespace detail {
struct store_state;
struct store_probe;
} // namespace detail

/** \brief Pagination and ordering of list(). */
struct ListParams {
    std::int64_t page{1};                   /**< 1-based */
    std::int64_t limit{10};                 /**< in [1, max_page_size] */
    std::string sort_by{"createdAt"};       /**< id | name | age | isActive | createdAt | updatedAt */
    std::string sort_order{"desc"};         /**< asc | desc */
};

/** \brief One page of the sorted user set. */
struct UserPage {
    std::vector<User> users;
    std::size_t total{0};                   /**< size of the full (non-corrupt) set */
    std::int64_t page{1};
    std::int64_t limit{10};
    std::size_t pages{0};                   /**< ceil(total / limit) */
};

struct DeleteConfirmation {
    std::string message;
};

class UserStore {
public:
    /** \brief Construct over a config that already passed validate_config().
     *
     * Use open() for configs from untrusted sources. An empty clock means core::now.
     */
    explicit UserStore(StoreConfig config = {}, core::clock_fn clock = {});

    /** \brief Validate the config, then construct. Errors: config_invalid. */
    [[nodiscard]] static auto open(StoreConfig config = {}, core::clock_fn clock = {})
        -> std::expected<UserStore, core::error>;
    ~UserStore();

    UserStore(UserStore&&) noexcept;
    UserStore& operator=(UserStore&&) noexcept;
    UserStore(const UserStore&) = delete;
    UserStore& operator=(const UserStore&) = delete;

    /**
     * \brief Validate raw input merged with generated id/createdAt/updatedAt and store it.
     *
     * Generated fields override any the caller supplied. On success a `created` event is
     * appended. Errors: validation/INVALID_USER_DATA with context.validationErrors.
     */
    auto create(const value& input, CreationSource source = CreationSource::admin) -> result<User>;

    /**
     * \brief Fetch a copy of one user.
     *
     * Errors: validation/INVALID_ID, business/NOT_FOUND, business/DATA_CORRUPTION.
     */
    auto get_by_id(const value& id) const -> result<User>;

    /**
     * \brief Sorted, paginated listing. Out-of-range page/limit are rejected, never clamped.
     *
     * Ties on the sort field keep insertion order. Errors: validation/INVALID_PAGINATION,
     * validation/INVALID_SORT.
     */
    auto list(const ListParams& params) const -> result<UserPage>;

    /** \brief list() from an untyped query {page?, limit?, sortBy?, sortOrder?}; numeric strings accepted. */
    auto list_from_query(const value& query) const -> result<UserPage>;

    /**
     * \brief Shallow-merge partial input over an existing user and re-validate.
     *
     * id and createdAt are always preserved; updatedAt is refreshed. Appends an `updated`
     * event carrying the previous values. Errors: those of get_by_id, validation/INVALID_UPDATES,
     * validation/INVALID_UPDATED_DATA.
     */
    auto update(const value& id, const value& partial) -> result<User>;

    /** \brief Remove a user; the `deleted` event keeps a full backup. */
    auto remove(const value& id) -> result<DeleteConfirmation>;

    /** \brief Audit events newest first, optionally only one kind ("created", "login-attempt", ...). */
    auto list_events(const value& kind = nullptr) const -> result<std::vector<AuditEvent>>;

    /** \brief Session-scoped feed of recent events, newest first. */
    auto session_feed() const -> result<std::vector<AuditEvent>>;

    /** \brief Validate and append a login-attempt event. Errors: validation/INVALID_EVENT. */
    auto record_login_attempt(const value& attempt) -> result<AuditEvent>;

    /**
     * \brief Re-insert a user recovered from a `deleted` backup.
     *
     * The caller vouches for the entity; an invalid one is a programming error and throws
     * core::assertion_error. Errors: business/DUPLICATE_ID.
     */
    auto restore(const User& user) -> result<User>;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto event_count() const -> std::size_t;
    [[nodiscard]] auto config() const -> const StoreConfig&;

    /** \brief Drop all users and events. */
    auto clear() -> void;

private:
    friend struct detail::store_probe;
    std::unique_ptr<detail::store_state> state_;
};

[[nodiscard]] auto to_json(const UserPage& page) -> value;
[[nodiscard]] auto to_json(const DeleteConfirmation& c) -> value;
[[nodiscard]] auto to_json(const std::vector<AuditEvent>& events) -> value;

} // namespace veritas
