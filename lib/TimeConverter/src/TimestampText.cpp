#include "TimestampText.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/string_view.h>

namespace
{
// Most specific layouts first; ParseTime refuses unconsumed trailing text.
constexpr const char* OffsetLayouts[] = {
    "%Y-%m-%d%ET%H:%M:%E*S%Ez",
    "%Y-%m-%d %H:%M:%E*S%Ez",
    "%Y-%m-%d%ET%H:%M:%E*S%z",
    "%Y-%m-%d %H:%M:%E*S%z",
    "%Y-%m-%d%ET%H:%M:%E*S %Ez",
    "%Y-%m-%d %H:%M:%E*S %Ez",
    "%Y-%m-%d%ET%H:%M%Ez",
    "%Y-%m-%d %H:%M%Ez",
};

constexpr const char* NaiveLayouts[] = {
    "%Y-%m-%d%ET%H:%M:%E*S",
    "%Y-%m-%d %H:%M:%E*S",
    "%Y-%m-%d%ET%H:%M",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
};

/**
 * @brief Check for a seconds field of 60.
 *
 * ParseTime normalizes 23:59:60 into the next minute; such text is refused instead.
 * The second ':' of the text separates minutes from seconds whenever seconds are present.
 *
 * @param[in] text Trimmed timestamp text
 * @return true if the seconds field reads 60
 */
bool HasLeapSecond(const std::string& text)
{
    const std::size_t firstColon = text.find(':');
    if (std::string::npos == firstColon)
    {
        return false;
    }

    const std::size_t secondColon = text.find(':', firstColon + 1);
    if ((std::string::npos == secondColon) || (text.size() < secondColon + 3))
    {
        return false;
    }
    return 0 == text.compare(secondColon + 1, 2, "60");
}

bool ParseWithOffset(const std::string& text, absl::Time& instant)
{
    std::string error;
    for (const char* layout : OffsetLayouts)
    {
        if (true == absl::ParseTime(layout, text, &instant, &error))
        {
            // Same microsecond granularity as the naive path.
            instant = absl::FromUnixMicros(absl::ToUnixMicros(instant));
            return true;
        }
    }
    return false;
}

bool ParseNaive(const std::string& text, NaiveTimestamp& wallClock)
{
    const absl::TimeZone utc = absl::UTCTimeZone();
    std::string error;
    absl::Time instant;
    for (const char* layout : NaiveLayouts)
    {
        if (false == absl::ParseTime(layout, text, utc, &instant, &error))
        {
            continue;
        }

        const absl::CivilSecond civilSecond = absl::ToCivilSecond(instant, utc);
        const absl::Duration subsecond = instant - absl::FromCivil(civilSecond, utc);
        wallClock = NaiveTimestamp(civilSecond, static_cast<std::int32_t>(absl::ToInt64Microseconds(subsecond)));
        return true;
    }
    return false;
}
}

bool ParseTimestampText(const std::string& text, ParsedTimestampText& parsed)
{
    const std::string trimmedText(absl::StripAsciiWhitespace(text));
    if ((true == trimmedText.empty()) || (true == HasLeapSecond(trimmedText)))
    {
        return false;
    }

    absl::Time instant;
    if (true == ParseWithOffset(trimmedText, instant))
    {
        parsed.hasUtcOffset = true;
        parsed.instant = instant;
        return true;
    }

    NaiveTimestamp wallClock;
    if (true == ParseNaive(trimmedText, wallClock))
    {
        parsed.hasUtcOffset = false;
        parsed.wallClock = wallClock;
        return true;
    }
    return false;
}
