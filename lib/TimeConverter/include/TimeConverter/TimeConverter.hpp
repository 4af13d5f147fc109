#pragma once

#include "TimeConverter/Timestamps.hpp"
#include "TimeConverter/TypeInputError.hpp"
#include "TimeZoneDatabase/TimeZoneDatabase.hpp"

#include <functional>
#include <string>

#include <absl/time/clock.h>
#include <absl/time/time.h>

/**
 * @brief Notification describing one conversion call.
 */
struct ConversionTrace
{
    const char* operation;  /**< Name of the public operation, e.g. "ToUniversal" */
    std::string detail;     /**< Human-readable description of the input */
};

/**
 * @brief Configuration parameters for a TimeConverter.
 */
struct TimeConverterConfig
{
    std::string defaultZone;     /**< Zone a naive value is read in when the caller names none */
    std::string defaultPattern;  /**< Format pattern used when the caller names none; empty selects ISO-8601 */

    std::function<absl::Time()> clock;                          /**< Time source for Now() */
    std::function<void(const ConversionTrace&)> onTrace;        /**< Optional callback for conversion notifications */

    /**
     * @brief Initialize configuration with default values.
     */
    TimeConverterConfig()
        : defaultZone(TimeZoneDatabase::UniversalZoneName)
        , defaultPattern()
        , clock(absl::Now)
        , onTrace(nullptr)
    {
    }
};

/**
 * @brief Converts among universal timestamps, zone-local timestamps and UNIX epoch values.
 *
 * Every operation is a pure function of its arguments, the configured clock (Now only)
 * and the zoneinfo database.
 */
class TimeConverter
{
  public:
    /**
     * @brief Construct a converter with default configuration.
     */
    TimeConverter();

    /**
     * @brief Construct a converter with the given configuration.
     *
     * @param[in] configuration Converter configuration
     * @throws UnknownZoneError if configuration.defaultZone does not resolve
     */
    explicit TimeConverter(const TimeConverterConfig& configuration);

    /**
     * @brief Get the current instant.
     *
     * @return Current time at microsecond precision, tagged as UTC
     */
    UniversalTimestamp Now() const;

    /**
     * @brief Convert a value to a universal timestamp.
     *
     * Zone-aware values convert directly. Naive values and offset-less text are read as
     * wall-clock time in the configured default zone. Numbers are epoch seconds.
     *
     * @param[in] value Value to convert
     * @return UTC-tagged instant
     * @throws TypeInputError for unsupported values or unparseable text
     */
    UniversalTimestamp ToUniversal(const TimeValue& value) const;

    /**
     * @brief Convert a value to a universal timestamp, reading naive input in the named zone.
     *
     * zoneName is ignored (and not resolved) for zone-aware values, numbers and text with an
     * explicit UTC offset.
     *
     * @param[in] value Value to convert
     * @param[in] zoneName Zone naive input is expressed in
     * @return UTC-tagged instant
     * @throws TypeInputError for unsupported values or unparseable text
     * @throws UnknownZoneError if zoneName is needed and does not resolve
     */
    UniversalTimestamp ToUniversal(const TimeValue& value, const std::string& zoneName) const;

    /**
     * @brief Alias of ToUniversal(const TimeValue&).
     */
    UniversalTimestamp FromLocal(const TimeValue& value) const;

    /**
     * @brief Alias of ToUniversal(const TimeValue&, const std::string&).
     */
    UniversalTimestamp FromLocal(const TimeValue& value, const std::string& zoneName) const;

    /**
     * @brief Express a value in the named zone.
     *
     * A naive value is taken to already be the target zone's wall clock; its fields are kept
     * and the zone is attached.
     *
     * @param[in] value Value to convert
     * @param[in] zoneName Target zone
     * @return Instant tagged with the target zone
     * @throws TypeInputError for unsupported values or unparseable text
     * @throws UnknownZoneError if zoneName does not resolve
     */
    LocalTimestamp ToLocal(const TimeValue& value, const std::string& zoneName) const;

    /**
     * @brief Convert epoch seconds to a universal timestamp.
     *
     * The fractional part is kept to the nearest microsecond.
     *
     * @param[in] epochValue Integer or floating-point seconds since the epoch
     * @return UTC-tagged instant
     * @throws TypeInputError if epochValue is not numeric, not finite or out of range
     */
    UniversalTimestamp FromUnix(const TimeValue& epochValue) const;

    /**
     * @brief Convert a zone-aware timestamp to epoch seconds.
     *
     * Sub-second precision is dropped: the result is floored to whole seconds.
     *
     * @param[in] value Zone-aware timestamp
     * @return Integral-valued epoch seconds
     * @throws TypeInputError if value is not a zone-aware timestamp
     */
    EpochTimestamp ToUnix(const TimeValue& value) const;

    /**
     * @brief Render a value in the named zone using the configured default pattern.
     *
     * @param[in] value Value to render, converted as by ToLocal
     * @param[in] zoneName Target zone
     * @return Formatted text
     */
    std::string Format(const TimeValue& value, const std::string& zoneName) const;

    /**
     * @brief Render a value in the named zone.
     *
     * An empty pattern selects ISO-8601 with numeric UTC offset, printing microseconds only
     * when non-zero. Otherwise strftime-style directives apply, with %f expanding to
     * six-digit microseconds.
     *
     * @param[in] value Value to render, converted as by ToLocal
     * @param[in] zoneName Target zone
     * @param[in] pattern Format pattern
     * @return Formatted text
     * @throws TypeInputError for unsupported values or unparseable text
     * @throws UnknownZoneError if zoneName does not resolve
     */
    std::string Format(const TimeValue& value, const std::string& zoneName, const std::string& pattern) const;

  private:
    UniversalTimestamp MakeUniversal(absl::Time instant) const;
    ZonedTimestamp Localize(const NaiveTimestamp& wallClock, const std::string& zoneName) const;
    UniversalTimestamp ConvertToUniversal(const TimeValue& value, const std::string& zoneName) const;
    UniversalTimestamp ConvertFromUnix(const TimeValue& epochValue) const;
    void Trace(const char* operation, const std::string& detail) const;

    TimeConverterConfig _config;
    TimeZoneDatabase _zoneDatabase;
    absl::TimeZone _universalZone;
};
