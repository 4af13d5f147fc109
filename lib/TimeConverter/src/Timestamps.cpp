#include "TimeConverter/Timestamps.hpp"
#include "TimeConverter/TypeInputError.hpp"

#include <iomanip>
#include <sstream>

namespace
{
constexpr std::int32_t MicrosecondsPerSecond = 1000000;

constexpr const char* IsoPatternSeconds = "%Y-%m-%dT%H:%M:%S%Ez";
constexpr const char* IsoPatternMicroseconds = "%Y-%m-%dT%H:%M:%E6S%Ez";
}

NaiveTimestamp::NaiveTimestamp(const absl::CivilSecond& wallClockValue, std::int32_t microsecondValue)
    : wallClock(wallClockValue)
    , microsecond(microsecondValue)
{
    if ((0 > microsecond) || (MicrosecondsPerSecond <= microsecond))
    {
        throw TypeInputError("Microsecond out of range: " + std::to_string(microsecond));
    }
}

bool operator==(const NaiveTimestamp& left, const NaiveTimestamp& right)
{
    return (left.wallClock == right.wallClock) && (left.microsecond == right.microsecond);
}

bool operator!=(const NaiveTimestamp& left, const NaiveTimestamp& right)
{
    return !(left == right);
}

std::ostream& operator<<(std::ostream& stream, const NaiveTimestamp& timestamp)
{
    stream << timestamp.wallClock;
    if (0 != timestamp.microsecond)
    {
        std::ostringstream fraction;
        fraction << '.' << std::setw(6) << std::setfill('0') << timestamp.microsecond;
        stream << fraction.str();
    }
    return stream;
}

ZonedTimestamp::ZonedTimestamp(absl::Time instant, const std::string& zoneName, const absl::TimeZone& zone)
    : _instant(instant)
    , _zoneName(zoneName)
    , _zone(zone)
{
}

absl::Time ZonedTimestamp::Instant() const
{
    return _instant;
}

const std::string& ZonedTimestamp::ZoneName() const
{
    return _zoneName;
}

const absl::TimeZone& ZonedTimestamp::Zone() const
{
    return _zone;
}

NaiveTimestamp ZonedTimestamp::WallClock() const
{
    const absl::TimeZone::CivilInfo civilInfo = _zone.At(_instant);
    return NaiveTimestamp(civilInfo.cs, static_cast<std::int32_t>(absl::ToInt64Microseconds(civilInfo.subsecond)));
}

int ZonedTimestamp::UtcOffsetSeconds() const
{
    return _zone.At(_instant).offset;
}

NaiveTimestamp ZonedTimestamp::StripZone() const
{
    return WallClock();
}

std::string ZonedTimestamp::ToIsoString() const
{
    const char* pattern = (0 == WallClock().microsecond) ? IsoPatternSeconds : IsoPatternMicroseconds;
    return absl::FormatTime(pattern, _instant, _zone);
}

bool operator==(const ZonedTimestamp& left, const ZonedTimestamp& right)
{
    return left.Instant() == right.Instant();
}

bool operator!=(const ZonedTimestamp& left, const ZonedTimestamp& right)
{
    return !(left == right);
}

std::ostream& operator<<(std::ostream& stream, const ZonedTimestamp& timestamp)
{
    return stream << timestamp.ToIsoString() << " [" << timestamp.ZoneName() << "]";
}
