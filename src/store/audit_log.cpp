#include "veritas/store/audit_log.hpp"

#include <algorithm>
#include <utility>

namespace veritas::store {

AuditLog::AuditLog(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

auto AuditLog::append(AuditEvent event) -> std::size_t {
    events_.push_back(std::move(event));
    std::size_t dropped = 0;
    while (events_.size() > capacity_) {
        events_.pop_front();
        ++dropped;
    }
    trimmed_ += dropped;
    return dropped;
}

auto AuditLog::newest_first() const -> std::vector<AuditEvent> {
    std::vector<AuditEvent> out(events_.rbegin(), events_.rend());
    std::stable_sort(out.begin(), out.end(), [](const AuditEvent& a, const AuditEvent& b) {
        return a.timestamp > b.timestamp;
    });
    return out;
}

auto AuditLog::clear() -> void {
    events_.clear();
    trimmed_ = 0;
}

} // namespace veritas::store
