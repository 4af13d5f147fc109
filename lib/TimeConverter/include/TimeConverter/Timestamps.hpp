#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

/**
 * @brief Seconds since 1970-01-01T00:00:00Z, possibly fractional.
 */
using EpochTimestamp = double;

/**
 * @brief Wall-clock date and time with no zone attached.
 */
struct NaiveTimestamp
{
    absl::CivilSecond wallClock;  /**< Civil fields down to the second */
    std::int32_t microsecond;     /**< Sub-second part, 0 to 999999 */

    /**
     * @brief Initialize to 1970-01-01T00:00:00.
     */
    NaiveTimestamp()
        : wallClock()
        , microsecond(0)
    {
    }

    /**
     * @brief Construct from civil fields.
     *
     * @param[in] wallClockValue Civil date and time
     * @param[in] microsecondValue Sub-second part
     * @throws TypeInputError if microsecondValue is outside 0 to 999999
     */
    NaiveTimestamp(const absl::CivilSecond& wallClockValue, std::int32_t microsecondValue = 0);
};

bool operator==(const NaiveTimestamp& left, const NaiveTimestamp& right);
bool operator!=(const NaiveTimestamp& left, const NaiveTimestamp& right);
std::ostream& operator<<(std::ostream& stream, const NaiveTimestamp& timestamp);

/**
 * @brief Point in time carrying an explicit named zone.
 *
 * Equality compares instants only: the same moment seen from two zones is equal.
 * Only TimeConverter creates values, so zoneName always names the zone it was resolved from.
 */
class ZonedTimestamp
{
  public:
    absl::Time Instant() const;
    const std::string& ZoneName() const;
    const absl::TimeZone& Zone() const;

    /**
     * @brief Get the wall-clock reading of this instant in its zone.
     *
     * @return Naive wall-clock fields
     */
    NaiveTimestamp WallClock() const;

    /**
     * @brief Get the UTC offset in effect at this instant.
     *
     * @return Offset in seconds east of UTC
     */
    int UtcOffsetSeconds() const;

    /**
     * @brief Drop the zone, keeping the wall-clock fields.
     *
     * @return Naive timestamp with the same wall-clock reading
     */
    NaiveTimestamp StripZone() const;

    /**
     * @brief Render as ISO-8601 with numeric UTC offset.
     *
     * Microseconds are printed only when non-zero.
     *
     * @return Text such as "2012-02-01T06:56:31-05:00"
     */
    std::string ToIsoString() const;

  private:
    friend class TimeConverter;

    /**
     * @brief Construct a zone-tagged instant.
     *
     * @param[in] instant Absolute point in time
     * @param[in] zoneName Name the zone was resolved from
     * @param[in] zone Zone rules resolved from zoneName
     */
    ZonedTimestamp(absl::Time instant, const std::string& zoneName, const absl::TimeZone& zone);

    absl::Time _instant;
    std::string _zoneName;
    absl::TimeZone _zone;
};

bool operator==(const ZonedTimestamp& left, const ZonedTimestamp& right);
bool operator!=(const ZonedTimestamp& left, const ZonedTimestamp& right);
std::ostream& operator<<(std::ostream& stream, const ZonedTimestamp& timestamp);

/**
 * @brief UTC-anchored instant; TimeConverter always tags it with the "UTC" zone.
 */
using UniversalTimestamp = ZonedTimestamp;

/**
 * @brief Instant in a named zone.
 */
using LocalTimestamp = ZonedTimestamp;

/**
 * @brief Any input accepted by the conversion entry points.
 *
 * std::monostate stands for a value of an unsupported shape and is always rejected.
 */
using TimeValue = std::variant<std::monostate, std::int64_t, EpochTimestamp, NaiveTimestamp, ZonedTimestamp, std::string>;
