/**
 * @file time.hpp
 * @brief ISO-8601 conversion at the text boundary.
 * @author ConstellationPlanner contributors
 *
 * Visibility windows and configuration carry timestamps as ISO-8601 text
 * with an explicit UTC offset ("Z" or "±HH:MM"). Internally everything is
 * a system_clock Timestamp in UTC.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace constellation_planner {

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|±HH:MM)".
 *
 * A space is accepted in place of 'T'. A missing offset is an error.
 */
[[nodiscard]] Result<Timestamp> parse_iso8601(std::string_view text);

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS[.mmm]Z".
 *
 * Milliseconds are emitted only when non-zero.
 */
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace constellation_planner
