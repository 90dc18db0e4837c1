#pragma once
#include <string>
#include <vector>
#include <ctime>
#include "Types.hpp"

struct RequestCounters;

class ResponseWriter
{
public:
    static std::string searchBody(StationIdSet const& evas,
                                  std::vector<TrainCandidate> const& trains,
                                  std::string const& timeZone);

    // Store outage: explicit error marker, empty result lists.
    static std::string degradedBody(std::string const& error);

    static std::string statsBody(RequestCounters const& counters);

    // Wall clock time in the given IANA zone, "HH:MM".
    static std::string formatClock(std::time_t t, std::string const& timeZone);
};
