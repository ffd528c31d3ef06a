#pragma once

/**
 * \file shape.hpp
 * \brief Declared entity shapes and their two validation modes.
 *
 * A shape is a table of field rules. The same table drives
 * - fast narrowing (`is_user`): a single yes/no decision, and
 * - detailed validation (`validate_user`): every failing field is reported, none is skipped.
 *
 * Presence is checked before type: an absent required key reports
 * "Missing or invalid <field> field", never a type-mismatch message. Nested records are
 * validated by their own shapes; the parent reports only its own field, with the nested
 * errors attached to the offending value as {"received": ..., "errors": [...]}.
 *
 * Narrowing is the only way to obtain a typed entity from an untyped value, and it only
 * happens after the shape has accepted the value. Unknown keys are dropped.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "veritas/core/timestamp.hpp"
#include "veritas/predicates.hpp"

namespace veritas {

struct Address {
    std::string street;
    std::string city;
    std::string state;
    std::string zip_code;   /**< wire name "zipCode" */
    std::string country;

    friend bool operator==(const Address&, const Address&) = default;
};

struct ContactInfo {
    std::string email;
    std::optional<std::string> phone;
    std::optional<Address> address;

    friend bool operator==(const ContactInfo&, const ContactInfo&) = default;
};

struct User {
    std::string id;
    std::string name;
    ContactInfo contact;
    std::int64_t age{0};
    bool is_active{false};                  /**< wire name "isActive" */
    std::vector<std::string> tags;
    std::optional<value> metadata;          /**< always a JSON object when engaged */
    core::timestamp created_at{};           /**< wire name "createdAt" */
    core::timestamp updated_at{};           /**< wire name "updatedAt" */

    friend bool operator==(const User&, const User&) = default;
};

/** \brief Plan of a regular user. */
enum class Subscription : std::uint8_t { basic, premium, enterprise };

/** \brief User with role "admin". */
struct AdminUser {
    User user;
    std::vector<std::string> permissions;
    std::optional<core::timestamp> last_login;   /**< wire name "lastLogin" */

    friend bool operator==(const AdminUser&, const AdminUser&) = default;
};

/** \brief User with role "user". */
struct RegularUser {
    User user;
    std::optional<Subscription> subscription;

    friend bool operator==(const RegularUser&, const RegularUser&) = default;
};

/** \brief One independently failing field. */
struct field_error {
    std::string field;
    std::string message;
    value received;     /**< offending value; null when the key is absent */
};

/** \brief Narrowed entity, or the non-empty list of field errors. */
template <typename T>
using validation_result = std::expected<T, std::vector<field_error>>;

using nested_validator_fn = std::vector<field_error> (*)(const value&);

/** \brief One declared field of a shape. */
struct field_rule {
    std::string_view name;                  /**< wire key */
    bool required{true};
    predicate_fn check{nullptr};            /**< fast predicate for the field value */
    std::string_view expectation;           /**< message when present but invalid */
    nested_validator_fn nested{nullptr};    /**< detailed errors of a nested record */
};

/** \brief Fast mode over a declared shape. */
[[nodiscard]] auto matches_shape(std::span<const field_rule> shape, const value& v) noexcept -> bool;

/** \brief Detailed mode over a declared shape; empty when the value matches. */
[[nodiscard]] auto shape_errors(std::span<const field_rule> shape, const value& v)
    -> std::vector<field_error>;

[[nodiscard]] auto address_shape() noexcept -> std::span<const field_rule>;
[[nodiscard]] auto contact_info_shape() noexcept -> std::span<const field_rule>;
[[nodiscard]] auto user_shape() noexcept -> std::span<const field_rule>;
/** \brief user_shape() followed by role == "admin", permissions and optional lastLogin. */
[[nodiscard]] auto admin_user_shape() noexcept -> std::span<const field_rule>;
/** \brief user_shape() followed by role == "user" and optional subscription. */
[[nodiscard]] auto regular_user_shape() noexcept -> std::span<const field_rule>;

[[nodiscard]] auto to_string(Subscription s) -> std::string_view;
[[nodiscard]] auto subscription_from_string(std::string_view s) noexcept -> std::optional<Subscription>;

// Fast narrowing
[[nodiscard]] auto is_address(const value& v) noexcept -> bool;
[[nodiscard]] auto is_contact_info(const value& v) noexcept -> bool;
[[nodiscard]] auto is_user(const value& v) noexcept -> bool;
[[nodiscard]] auto is_admin_user(const value& v) noexcept -> bool;
[[nodiscard]] auto is_regular_user(const value& v) noexcept -> bool;
/** \brief Array of non-empty strings. */
[[nodiscard]] auto is_tag_list(const value& v) noexcept -> bool;

// Detailed validation
[[nodiscard]] auto validate_address(const value& v) -> validation_result<Address>;
[[nodiscard]] auto validate_contact_info(const value& v) -> validation_result<ContactInfo>;
[[nodiscard]] auto validate_user(const value& v) -> validation_result<User>;
[[nodiscard]] auto validate_admin_user(const value& v) -> validation_result<AdminUser>;
[[nodiscard]] auto validate_regular_user(const value& v) -> validation_result<RegularUser>;

// Wire form
[[nodiscard]] auto to_json(const Address& a) -> value;
[[nodiscard]] auto to_json(const ContactInfo& c) -> value;
[[nodiscard]] auto to_json(const User& u) -> value;
[[nodiscard]] auto to_json(const AdminUser& u) -> value;
[[nodiscard]] auto to_json(const RegularUser& u) -> value;
[[nodiscard]] auto to_json(const field_error& e) -> value;
[[nodiscard]] auto to_json(const std::vector<field_error>& errors) -> value;

} // namespace veritas
