#pragma once

#include <stdexcept>
#include <string>

#include <absl/time/time.h>

/**
 * @brief Error raised when a zone name does not resolve in the timezone database.
 */
class UnknownZoneError : public std::runtime_error
{
  public:
    /**
     * @brief Construct the error for the given zone name.
     *
     * @param[in] zoneName Zone name that failed to resolve
     */
    explicit UnknownZoneError(const std::string& zoneName);

    /**
     * @brief Get the zone name that failed to resolve.
     *
     * @return Offending zone name
     */
    const std::string& ZoneName() const noexcept;

  private:
    std::string _zoneName;
};

/**
 * @brief Infrastructure component resolving zone names against the system zoneinfo database.
 */
class TimeZoneDatabase
{
  public:
    /**
     * @brief Name of the universal zone.
     */
    static constexpr const char* UniversalZoneName = "UTC";

    /**
     * @brief Resolve a zone name to its offset rules.
     *
     * @param[in] zoneName Zone identifier such as "Europe/Amsterdam" or "EST"
     * @return Resolved time zone
     * @throws UnknownZoneError if the name is empty or unknown
     */
    absl::TimeZone Resolve(const std::string& zoneName) const;

    /**
     * @brief Check whether a zone name resolves.
     *
     * @param[in] zoneName Zone identifier
     * @return true if the zone is known, false otherwise
     */
    bool IsKnown(const std::string& zoneName) const;
};
