#include "TimeConverter/TimeConverter.hpp"

#include "TimestampText.hpp"

#include <cmath>
#include <sstream>
#include <variant>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace
{
constexpr double MicrosecondsPerSecond = 1000000.0;

// 0001-01-01T00:00:00Z to 9999-12-31T23:59:59Z
constexpr double MinEpochSeconds = -62135596800.0;
constexpr double MaxEpochSeconds = 253402300799.0;

/**
 * @brief Describe a value for conversion traces.
 *
 * @param[in] value Value to describe
 * @return Short description naming the value's shape and content
 */
std::string DescribeValue(const TimeValue& value)
{
    if (const auto* epochInteger = std::get_if<std::int64_t>(&value))
    {
        return absl::StrCat("epoch ", *epochInteger);
    }
    if (const auto* epochSeconds = std::get_if<EpochTimestamp>(&value))
    {
        return absl::StrFormat("epoch %.6f", *epochSeconds);
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        return absl::StrCat("text '", *text, "'");
    }

    std::ostringstream description;
    if (const auto* naive = std::get_if<NaiveTimestamp>(&value))
    {
        description << "naive " << *naive;
    }
    else if (const auto* zoned = std::get_if<ZonedTimestamp>(&value))
    {
        description << "zoned " << *zoned;
    }
    else
    {
        description << "unsupported value";
    }
    return description.str();
}

bool IsEpochValue(const TimeValue& value)
{
    return (true == std::holds_alternative<std::int64_t>(value)) || (true == std::holds_alternative<EpochTimestamp>(value));
}

/**
 * @brief Convert floating-point epoch seconds to an instant.
 *
 * The fraction is rounded to the nearest microsecond, ties to even.
 *
 * @param[in] epochSeconds Seconds since the epoch
 * @return Instant at microsecond precision
 * @throws TypeInputError if epochSeconds is not finite or outside years 1 to 9999
 */
absl::Time EpochSecondsToInstant(double epochSeconds)
{
    if (false == std::isfinite(epochSeconds))
    {
        throw TypeInputError("Epoch value is not a finite number");
    }

    const double wholeSeconds = std::floor(epochSeconds);
    if ((MinEpochSeconds > wholeSeconds) || (MaxEpochSeconds < wholeSeconds))
    {
        throw TypeInputError(absl::StrFormat("Epoch value out of range: %.6f", epochSeconds));
    }

    const double microseconds = std::nearbyint((epochSeconds - wholeSeconds) * MicrosecondsPerSecond);
    return absl::FromUnixSeconds(static_cast<std::int64_t>(wholeSeconds)) + absl::Microseconds(static_cast<std::int64_t>(microseconds));
}

absl::Time EpochSecondsToInstant(std::int64_t epochSeconds)
{
    if ((MinEpochSeconds > static_cast<double>(epochSeconds)) || (MaxEpochSeconds < static_cast<double>(epochSeconds)))
    {
        throw TypeInputError(absl::StrCat("Epoch value out of range: ", epochSeconds));
    }
    return absl::FromUnixSeconds(epochSeconds);
}

/**
 * @brief Map strftime-style directives onto absl::FormatTime directives.
 *
 * %f becomes six-digit microseconds; every other directive passes through.
 *
 * @param[in] pattern strftime-style pattern
 * @return Pattern understood by absl::FormatTime
 */
std::string TranslatePattern(const std::string& pattern)
{
    std::string translated;
    translated.reserve(pattern.size());

    for (std::size_t index = 0; index < pattern.size(); ++index)
    {
        const char character = pattern[index];
        if (('%' != character) || (pattern.size() <= index + 1))
        {
            translated.push_back(character);
            continue;
        }

        const char directive = pattern[index + 1];
        if ('f' == directive)
        {
            translated += "%E6f";
        }
        else
        {
            translated.push_back('%');
            translated.push_back(directive);
        }
        ++index;
    }
    return translated;
}
}

TimeConverter::TimeConverter() : TimeConverter(TimeConverterConfig())
{
}

TimeConverter::TimeConverter(const TimeConverterConfig& configuration)
    : _config(configuration)
    , _zoneDatabase()
    , _universalZone(absl::UTCTimeZone())
{
    if (false == _zoneDatabase.IsKnown(_config.defaultZone))
    {
        throw UnknownZoneError(_config.defaultZone);
    }

    if (nullptr == _config.clock)
    {
        _config.clock = absl::Now;
    }
}

UniversalTimestamp TimeConverter::Now() const
{
    const absl::Time currentTime = _config.clock();
    Trace("Now", absl::FormatTime(currentTime, _universalZone));
    return MakeUniversal(absl::FromUnixMicros(absl::ToUnixMicros(currentTime)));
}

UniversalTimestamp TimeConverter::ToUniversal(const TimeValue& value) const
{
    return ToUniversal(value, _config.defaultZone);
}

UniversalTimestamp TimeConverter::ToUniversal(const TimeValue& value, const std::string& zoneName) const
{
    Trace("ToUniversal", absl::StrCat(DescribeValue(value), " in zone ", zoneName));
    return ConvertToUniversal(value, zoneName);
}

UniversalTimestamp TimeConverter::FromLocal(const TimeValue& value) const
{
    return ToUniversal(value);
}

UniversalTimestamp TimeConverter::FromLocal(const TimeValue& value, const std::string& zoneName) const
{
    return ToUniversal(value, zoneName);
}

LocalTimestamp TimeConverter::ToLocal(const TimeValue& value, const std::string& zoneName) const
{
    Trace("ToLocal", absl::StrCat(DescribeValue(value), " to zone ", zoneName));

    const absl::TimeZone zone = _zoneDatabase.Resolve(zoneName);

    if (const auto* zoned = std::get_if<ZonedTimestamp>(&value))
    {
        return ZonedTimestamp(zoned->Instant(), zoneName, zone);
    }
    if (const auto* naive = std::get_if<NaiveTimestamp>(&value))
    {
        return Localize(*naive, zoneName);
    }

    const UniversalTimestamp universal = ConvertToUniversal(value, zoneName);
    return ZonedTimestamp(universal.Instant(), zoneName, zone);
}

UniversalTimestamp TimeConverter::FromUnix(const TimeValue& epochValue) const
{
    Trace("FromUnix", DescribeValue(epochValue));
    return ConvertFromUnix(epochValue);
}

EpochTimestamp TimeConverter::ToUnix(const TimeValue& value) const
{
    Trace("ToUnix", DescribeValue(value));

    const auto* zoned = std::get_if<ZonedTimestamp>(&value);
    if (nullptr == zoned)
    {
        if (true == std::holds_alternative<NaiveTimestamp>(value))
        {
            throw TypeInputError("ToUnix refuses a timestamp without zone information");
        }
        throw TypeInputError("ToUnix expects a zone-aware timestamp");
    }

    return static_cast<EpochTimestamp>(absl::ToUnixSeconds(zoned->Instant()));
}

std::string TimeConverter::Format(const TimeValue& value, const std::string& zoneName) const
{
    return Format(value, zoneName, _config.defaultPattern);
}

std::string TimeConverter::Format(const TimeValue& value, const std::string& zoneName, const std::string& pattern) const
{
    const LocalTimestamp local = ToLocal(value, zoneName);
    Trace("Format", absl::StrCat(local.ToIsoString(), " with pattern '", pattern, "'"));

    if (true == pattern.empty())
    {
        return local.ToIsoString();
    }
    return absl::FormatTime(TranslatePattern(pattern), local.Instant(), local.Zone());
}

UniversalTimestamp TimeConverter::MakeUniversal(absl::Time instant) const
{
    return UniversalTimestamp(instant, TimeZoneDatabase::UniversalZoneName, _universalZone);
}

/**
 * @brief Attach a zone to a wall-clock reading.
 *
 * Wall-clock times skipped by a transition use the pre-transition offset; repeated
 * wall-clock times resolve to the later, post-transition instant.
 */
ZonedTimestamp TimeConverter::Localize(const NaiveTimestamp& wallClock, const std::string& zoneName) const
{
    const absl::TimeZone zone = _zoneDatabase.Resolve(zoneName);
    const absl::TimeZone::TimeInfo timeInfo = zone.At(wallClock.wallClock);

    const absl::Time wholeSeconds = (absl::TimeZone::TimeInfo::REPEATED == timeInfo.kind) ? timeInfo.post : timeInfo.pre;
    return ZonedTimestamp(wholeSeconds + absl::Microseconds(wallClock.microsecond), zoneName, zone);
}

UniversalTimestamp TimeConverter::ConvertToUniversal(const TimeValue& value, const std::string& zoneName) const
{
    if (const auto* zoned = std::get_if<ZonedTimestamp>(&value))
    {
        return MakeUniversal(zoned->Instant());
    }
    if (const auto* naive = std::get_if<NaiveTimestamp>(&value))
    {
        return MakeUniversal(Localize(*naive, zoneName).Instant());
    }
    if (true == IsEpochValue(value))
    {
        return ConvertFromUnix(value);
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        ParsedTimestampText parsed;
        if (false == ParseTimestampText(*text, parsed))
        {
            throw TypeInputError("Unparseable timestamp text: '" + *text + "'");
        }
        if (true == parsed.hasUtcOffset)
        {
            return MakeUniversal(parsed.instant);
        }
        return MakeUniversal(Localize(parsed.wallClock, zoneName).Instant());
    }

    throw TypeInputError("Expected an epoch number, a naive or zone-aware timestamp, or timestamp text");
}

UniversalTimestamp TimeConverter::ConvertFromUnix(const TimeValue& epochValue) const
{
    if (const auto* epochInteger = std::get_if<std::int64_t>(&epochValue))
    {
        return MakeUniversal(EpochSecondsToInstant(*epochInteger));
    }
    if (const auto* epochSeconds = std::get_if<EpochTimestamp>(&epochValue))
    {
        return MakeUniversal(EpochSecondsToInstant(*epochSeconds));
    }

    throw TypeInputError("FromUnix expects a numeric epoch value");
}

void TimeConverter::Trace(const char* operation, const std::string& detail) const
{
    if (nullptr != _config.onTrace)
    {
        _config.onTrace(ConversionTrace{operation, detail});
    }
}
