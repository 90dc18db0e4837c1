#pragma once
#include <map>
#include <vector>
#include <ctime>
#include "Types.hpp"

enum class LegMetric
{
    Segment,        // distance to the closed segment between the two stops
    Perpendicular   // distance to the infinite line through both stops
};

struct EstimatorOptions
{
    double maxDistanceKm = 50.0;
    LegMetric metric = LegMetric::Segment;
    std::size_t maxResults = 10;
    std::time_t departureGraceSec = 300;
};

struct EstimateResult
{
    std::vector<TrainCandidate> trains;   // emitted, ascending distance
    std::size_t considered = 0;
    std::size_t rejected = 0;
    std::size_t droppedByDedup = 0;
    std::size_t droppedByDistance = 0;
};

// Arrival boards keyed by the station they were requested for.
using ArrivalBoards = std::map<StationId, std::vector<ArrivalRecord>>;

class PositionEstimator
{
private:
    EstimatorOptions options;

    double legCloseness(Coordinate const& p, Coordinate const& a, Coordinate const& b) const;

public:
    explicit PositionEstimator(EstimatorOptions options = {});

    EstimateResult estimate(Coordinate const& query, StationIdSet const& candidates,
                            ArrivalBoards const& boards, std::time_t now) const;

    // Constructs the candidate for one arrival record; returns it Rejected when
    // no valid coarse location exists.
    TrainCandidate locate(ArrivalRecord const& record, StationId queriedStation,
                          Coordinate const& query, std::time_t now) const;

    // Keeps one candidate per train number, applies the distance cut-off and
    // the result limit.
    EstimateResult rank(std::vector<TrainCandidate> candidates) const;

    // Called for every further detection of an already kept train. Leaves kept unchanged.
    void mergeDetections(TrainCandidate& kept, TrainCandidate const& duplicate) const;

    [[nodiscard]] double likelihood(double distanceKm) const noexcept;
    [[nodiscard]] EstimatorOptions const& getOptions() const noexcept;

    // Previous stopovers followed by the requested stop, with realtime values filled in.
    static std::vector<StopoverEvent> normalizeStopovers(ArrivalRecord const& record);

    static double progressRatio(std::time_t previousDeparture, std::time_t nextArrival, std::time_t now) noexcept;
};
