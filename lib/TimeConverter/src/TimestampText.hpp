#pragma once

#include "TimeConverter/Timestamps.hpp"

#include <string>

#include <absl/time/time.h>

/**
 * @brief Result of parsing timestamp text.
 */
struct ParsedTimestampText
{
    bool hasUtcOffset;         /**< Text carried an explicit UTC offset */
    absl::Time instant;        /**< Parsed instant, valid when hasUtcOffset is true */
    NaiveTimestamp wallClock;  /**< Parsed wall clock, valid when hasUtcOffset is false */

    ParsedTimestampText()
        : hasUtcOffset(false)
        , instant()
        , wallClock()
    {
    }
};

/**
 * @brief Parse ISO-8601-like timestamp text.
 *
 * Accepts a YYYY-MM-DD date, optionally followed by a 'T' or space and a time of day
 * (HH:MM, HH:MM:SS or HH:MM:SS.fraction), optionally followed by a UTC offset
 * (+hh:mm, -hh:mm, +hhmm or Z).
 *
 * @param[in] text Timestamp text
 * @param[out] parsed Parse result
 * @return true on success, false if the text matches no accepted layout
 */
bool ParseTimestampText(const std::string& text, ParsedTimestampText& parsed);
