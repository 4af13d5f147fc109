#include "TimeZoneDatabase/TimeZoneDatabase.hpp"

namespace
{
/**
 * @brief Load a zone from the zoneinfo database.
 *
 * LoadTimeZone maps an empty name to UTC, so empty names are refused up front.
 *
 * @param[in] zoneName Zone identifier
 * @param[out] zone Loaded zone on success
 * @return true on success, false if the name does not resolve
 */
bool LoadZone(const std::string& zoneName, absl::TimeZone& zone)
{
    if (true == zoneName.empty())
    {
        return false;
    }
    return absl::LoadTimeZone(zoneName, &zone);
}
}

UnknownZoneError::UnknownZoneError(const std::string& zoneName)
    : std::runtime_error("Unknown time zone: '" + zoneName + "'")
    , _zoneName(zoneName)
{
}

const std::string& UnknownZoneError::ZoneName() const noexcept
{
    return _zoneName;
}

absl::TimeZone TimeZoneDatabase::Resolve(const std::string& zoneName) const
{
    absl::TimeZone zone;
    if (false == LoadZone(zoneName, zone))
    {
        throw UnknownZoneError(zoneName);
    }
    return zone;
}

bool TimeZoneDatabase::IsKnown(const std::string& zoneName) const
{
    absl::TimeZone zone;
    return LoadZone(zoneName, zone);
}
