#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <cstdint>
#include <ctime>
#include <optional>

using StationId = std::int64_t;
using StationIdSet = std::set<StationId>;

struct Coordinate
{
    double lat = 0.0;
    double lon = 0.0;
};

struct GridCell
{
    int latIdx = 0;
    int lonIdx = 0;

    bool operator<(GridCell const& o) const
    {
        return latIdx != o.latIdx ? latIdx < o.latIdx : lonIdx < o.lonIdx;
    }
    bool operator==(GridCell const& o) const
    {
        return latIdx == o.latIdx && lonIdx == o.lonIdx;
    }
};

// Cell -> every station a train near that cell may be travelling between.
using CandidateStationSet = std::map<GridCell, StationIdSet>;

struct ShapePoint
{
    double lat = 0.0;
    double lon = 0.0;
    double distance = 0.0;   // cumulative, meters
};

using Shape = std::vector<ShapePoint>;

struct TripStop
{
    std::string stationName;
    double distance = 0.0;
};

using TripStopSequence = std::vector<TripStop>;

struct PolylineVertex
{
    double lat = 0.0;
    double lon = 0.0;
    std::optional<StationId> station;   // set where the vertex is a stop
};

struct PolylineLeg
{
    StationId from = 0;
    StationId to = 0;
    std::vector<Coordinate> points;
};

struct Station
{
    StationId id = 0;
    std::string name;
    Coordinate location;
};

// One stop of a trip as reported by the realtime source. Times are epoch seconds.
struct StopoverEvent
{
    Station station;
    std::optional<std::time_t> plannedArrival;
    std::optional<std::time_t> arrival;
    std::optional<std::time_t> plannedDeparture;
    std::optional<std::time_t> departure;
};

// One entry of a station's arrival board.
struct ArrivalRecord
{
    std::string tripId;
    std::string line;
    std::string trainNumber;
    Station stop;
    std::optional<std::time_t> plannedWhen;
    std::optional<std::time_t> when;
    std::optional<int> delay;   // seconds
    std::vector<StopoverEvent> previousStopovers;
};

enum class CandidateState
{
    Constructed,
    LocationComputed,
    Rejected,
    Ranked,
    Emitted,
    DroppedByDistance,
    DroppedByDedup
};

struct TrainCandidate
{
    std::string tripId;
    std::string line;
    std::string trainNumber;
    StationId queriedStation = 0;
    std::vector<StopoverEvent> stopovers;   // normalized, queried stop last

    std::size_t legIndex = 0;               // traversal leg: stopovers[legIndex] -> [legIndex + 1]
    Station previous;
    Station next;
    std::time_t previousDeparture = 0;
    std::time_t nextArrival = 0;

    double progress = 0.0;
    Coordinate location;
    double distanceKm = 0.0;
    double likelihood = 0.0;
    bool preferred = false;
    CandidateState state = CandidateState::Constructed;
};
