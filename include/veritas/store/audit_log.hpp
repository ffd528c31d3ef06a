#pragma once

/** \file audit_log.hpp
 *  \brief Bounded append-only event log.
 *
 * Events are never mutated or removed individually. Once the capacity is exceeded the oldest
 * events are discarded so that the newest `capacity` remain ("last N" retention).
 *
 * Thread-safety: none; the owning store serializes access.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "veritas/audit_event.hpp"

namespace veritas::store {

class AuditLog {
public:
    explicit AuditLog(std::size_t capacity = 100);

    /** \brief Append one event. \return number of old events discarded by retention (0 or 1). */
    auto append(AuditEvent event) -> std::size_t;

    /** \brief Events in append order, oldest first. */
    [[nodiscard]] auto events() const -> const std::deque<AuditEvent>& { return events_; }

    /** \brief Copy ordered newest first: timestamp descending, later appends first on ties. */
    [[nodiscard]] auto newest_first() const -> std::vector<AuditEvent>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return events_.size(); }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    /** \brief Total events discarded by retention since construction or clear(). */
    [[nodiscard]] auto trimmed() const noexcept -> std::uint64_t { return trimmed_; }

    auto clear() -> void;

private:
    std::deque<AuditEvent> events_;
    std::size_t capacity_;
    std::uint64_t trimmed_{0};
};

} // namespace veritas::store
