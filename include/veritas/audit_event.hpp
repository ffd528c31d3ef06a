#pragma once

/**
 * \file audit_event.hpp
 * \brief Audit events: a closed tagged union keyed by event kind.
 *
 * Wire form: {"type": <kind>, "timestamp": <ISO-8601>, "data": {...}} where kind is one of
 * "created", "updated", "deleted", "login-attempt".
 *
 * Dispatch validates the envelope first (discriminant string, valid timestamp, object payload),
 * then the payload of the selected variant. Unknown discriminants are rejected. Payload failures
 * are reported as one `data` error whose value is {"received": ..., "errors": [...]}.
 *
 * Every site that branches on the kind either visits EventPayload with an overload set
 * (a missing alternative does not compile) or switches over EventKind without a default
 * (built with -Werror=switch) and throws std::logic_error after the switch.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "veritas/core/timestamp.hpp"
#include "veritas/shape.hpp"

namespace veritas {

enum class EventKind : std::uint8_t { created, updated, deleted, login_attempt };

/** \brief How a created entity entered the store. */
enum class CreationSource : std::uint8_t { registration, admin, imported };  // wire: "import"

struct UserCreated {
    User user;
    CreationSource source{CreationSource::admin};
    std::optional<value> metadata;

    friend bool operator==(const UserCreated&, const UserCreated&) = default;
};

struct UserUpdated {
    std::string user_id;
    value changes;              /**< caller's partial input, an object */
    value previous_values;      /**< entity before the update, an object */
    std::string updated_by;

    friend bool operator==(const UserUpdated&, const UserUpdated&) = default;
};

struct UserDeleted {
    std::string user_id;
    std::string deleted_by;
    std::optional<std::string> reason;
    User backup;

    friend bool operator==(const UserDeleted&, const UserDeleted&) = default;
};

struct LoginAttempt {
    std::string user_id;
    std::string ip;
    std::string user_agent;
    bool successful{false};
    std::optional<std::string> failure_reason;

    friend bool operator==(const LoginAttempt&, const LoginAttempt&) = default;
};

using EventPayload = std::variant<UserCreated, UserUpdated, UserDeleted, LoginAttempt>;

struct AuditEvent {
    core::timestamp timestamp{};
    EventPayload payload;

    friend bool operator==(const AuditEvent&, const AuditEvent&) = default;
};

[[nodiscard]] auto kind_of(const AuditEvent& e) noexcept -> EventKind;
[[nodiscard]] auto to_string(EventKind kind) -> std::string_view;
[[nodiscard]] auto event_kind_from_string(std::string_view s) noexcept -> std::optional<EventKind>;
[[nodiscard]] auto to_string(CreationSource source) -> std::string_view;
[[nodiscard]] auto creation_source_from_string(std::string_view s) noexcept
    -> std::optional<CreationSource>;

/** \brief Fast mode: envelope and payload both valid. */
[[nodiscard]] auto is_audit_event(const value& v) noexcept -> bool;

/** \brief Detailed mode: narrowed event or every failing envelope/payload field. */
[[nodiscard]] auto validate_audit_event(const value& v) -> validation_result<AuditEvent>;

/** \brief Payload-only validation for a known kind (used when recording events from raw input). */
[[nodiscard]] auto validate_event_payload(EventKind kind, const value& data)
    -> validation_result<EventPayload>;

[[nodiscard]] auto to_json(const AuditEvent& e) -> value;
[[nodiscard]] auto payload_to_json(const EventPayload& p) -> value;

} // namespace veritas
