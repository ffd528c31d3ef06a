#pragma once

/** \file timestamp.hpp
 *  \brief Millisecond UTC instants and their ISO-8601 wire form ("2023-01-01T00:00:00.000Z").
 */

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace veritas::core {

using timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/** \brief Injectable time source; stores take one so tests never read the wall clock. */
using clock_fn = std::function<timestamp()>;

/** \brief Representable range: 0000-01-01T00:00:00.000Z through 9999-12-31T23:59:59.999Z. */
auto min_timestamp() -> timestamp;
auto max_timestamp() -> timestamp;

/** \brief Current wall-clock time truncated to milliseconds. */
auto now() -> timestamp;

/**
 * \brief Parse `YYYY-MM-DDTHH:MM:SS[.f{1,9}](Z|±HH:MM)` or a bare `YYYY-MM-DD` (midnight UTC).
 * \return nullopt when the text is malformed, names an impossible calendar date/time, or
 * lands outside [min_timestamp(), max_timestamp()] once the zone offset is applied.
 * Fractions beyond milliseconds are truncated.
 */
auto parse_timestamp(std::string_view text) -> std::optional<timestamp>;

/** \brief Canonical form, always UTC with exactly three fractional digits. */
auto format_timestamp(timestamp t) -> std::string;

} // namespace veritas::core
