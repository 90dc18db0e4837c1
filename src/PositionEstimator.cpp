#include "PositionEstimator.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>
#include "Geo.hpp"

namespace
{

std::optional<std::time_t> normalizeTime(std::optional<std::time_t> realtime,
                                         std::optional<std::time_t> planned,
                                         int delay)
{
    if (realtime && (!planned || *realtime != *planned))
        return realtime;
    if (planned)
        return *planned + delay;
    return realtime;
}

std::optional<std::time_t> arrivalOf(StopoverEvent const& s)
{
    return s.arrival ? s.arrival : s.departure;
}

std::optional<std::time_t> departureOf(StopoverEvent const& s)
{
    return s.departure ? s.departure : s.arrival;
}

}

PositionEstimator::PositionEstimator(EstimatorOptions options)
    : options(std::move(options))
{
}

EstimatorOptions const& PositionEstimator::getOptions() const noexcept
{
    return options;
}

std::vector<StopoverEvent> PositionEstimator::normalizeStopovers(ArrivalRecord const& record)
{
    int delay = record.delay.value_or(0);

    std::vector<StopoverEvent> out;
    out.reserve(record.previousStopovers.size() + 1);

    for (StopoverEvent s : record.previousStopovers)
    {
        s.arrival   = normalizeTime(s.arrival, s.plannedArrival, delay);
        s.departure = normalizeTime(s.departure, s.plannedDeparture, delay);
        out.push_back(std::move(s));
    }

    StopoverEvent requested;
    requested.station = record.stop;
    requested.plannedArrival = record.plannedWhen;
    requested.arrival = normalizeTime(record.when, record.plannedWhen, delay);
    out.push_back(std::move(requested));

    return out;
}

double PositionEstimator::progressRatio(std::time_t previousDeparture, std::time_t nextArrival, std::time_t now) noexcept
{
    double total = static_cast<double>(nextArrival - previousDeparture);
    if (total <= 0.0)
        return now >= nextArrival ? 1.0 : 0.0;

    double remaining = static_cast<double>(nextArrival - now);
    return std::clamp(1.0 - remaining / total, 0.0, 1.0);
}

double PositionEstimator::likelihood(double distanceKm) const noexcept
{
    return 100.0 - 100.0 * distanceKm / options.maxDistanceKm;
}

double PositionEstimator::legCloseness(Coordinate const& p, Coordinate const& a, Coordinate const& b) const
{
    if (options.metric == LegMetric::Perpendicular)
        return Geo::perpendicularDistance(p, a, b);
    return Geo::segmentDistance(p, a, b);
}

TrainCandidate PositionEstimator::locate(ArrivalRecord const& record, StationId queriedStation,
                                         Coordinate const& query, std::time_t now) const
{
    TrainCandidate c;
    c.tripId = record.tripId;
    c.line = record.line;
    c.trainNumber = record.trainNumber;
    c.queriedStation = queriedStation;
    c.stopovers = normalizeStopovers(record);

    auto reject = [&c]() -> TrainCandidate {
        c.state = CandidateState::Rejected;
        return c;
    };

    if (c.stopovers.size() < 2)
        return reject();

    // Not started yet and not about to.
    auto firstDeparture = departureOf(c.stopovers.front());
    if (firstDeparture && *firstDeparture > now + options.departureGraceSec)
        return reject();

    std::optional<std::size_t> traversal;
    std::size_t closest = 0;
    double closestMetric = std::numeric_limits<double>::max();

    for (std::size_t i = 0; i + 1 < c.stopovers.size(); ++i)
    {
        Station const& from = c.stopovers[i].station;
        Station const& to   = c.stopovers[i + 1].station;

        double metric = legCloseness(query, from.location, to.location);
        if (metric < closestMetric)
        {
            closestMetric = metric;
            closest = i;
        }

        auto target = arrivalOf(c.stopovers[i + 1]);
        if (!traversal && target && *target > now)
            traversal = i;
    }

    if (!traversal || *traversal != closest)
        return reject();

    StopoverEvent const& from = c.stopovers[*traversal];
    StopoverEvent const& to   = c.stopovers[*traversal + 1];
    auto departed = departureOf(from);
    if (!departed)
        return reject();

    c.legIndex = *traversal;
    c.previous = from.station;
    c.next = to.station;
    c.previousDeparture = *departed;
    c.nextArrival = *arrivalOf(to);

    c.progress = progressRatio(c.previousDeparture, c.nextArrival, now);
    // TODO: on legs of 20 km and more, follow the trip polyline instead of the straight line.
    c.location = Geo::interpolate(c.previous.location, c.next.location, c.progress);

    c.distanceKm = Geo::distanceKm(c.location, query);
    c.likelihood = likelihood(c.distanceKm);
    c.preferred = c.next.id == queriedStation;
    c.state = CandidateState::LocationComputed;
    return c;
}

void PositionEstimator::mergeDetections(TrainCandidate& /*kept*/, TrainCandidate const& /*duplicate*/) const
{
}

EstimateResult PositionEstimator::rank(std::vector<TrainCandidate> candidates) const
{
    EstimateResult result;

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](TrainCandidate const& a, TrainCandidate const& b) { return a.distanceKm < b.distanceKm; });

    std::vector<TrainCandidate> kept;
    std::unordered_map<std::string, std::size_t> byTrain;

    for (TrainCandidate& c : candidates)
    {
        c.state = CandidateState::Ranked;
        std::string key = c.trainNumber.empty() ? c.tripId : c.trainNumber;

        auto it = byTrain.find(key);
        if (it == byTrain.end())
        {
            byTrain.emplace(key, kept.size());
            kept.push_back(std::move(c));
            continue;
        }

        TrainCandidate& current = kept[it->second];
        if (c.preferred && !current.preferred)
            std::swap(current, c);
        mergeDetections(current, c);
        c.state = CandidateState::DroppedByDedup;
        ++result.droppedByDedup;
    }

    std::stable_sort(kept.begin(), kept.end(),
                     [](TrainCandidate const& a, TrainCandidate const& b) { return a.distanceKm < b.distanceKm; });

    for (TrainCandidate& c : kept)
    {
        if (c.distanceKm >= options.maxDistanceKm || result.trains.size() >= options.maxResults)
        {
            c.state = CandidateState::DroppedByDistance;
            ++result.droppedByDistance;
            continue;
        }

        c.state = CandidateState::Emitted;
        result.trains.push_back(std::move(c));
    }

    return result;
}

EstimateResult PositionEstimator::estimate(Coordinate const& query, StationIdSet const& candidates,
                                           ArrivalBoards const& boards, std::time_t now) const
{
    std::vector<TrainCandidate> located;
    std::size_t considered = 0;
    std::size_t rejected = 0;

    for (auto const& board : boards)
    {
        for (ArrivalRecord const& record : board.second)
        {
            // The board's own station is always a candidate; only previous stopovers count.
            auto nearby = std::count_if(record.previousStopovers.begin(), record.previousStopovers.end(),
                                        [&candidates](StopoverEvent const& s) { return candidates.count(s.station.id) > 0; });
            if (nearby < 2)
                continue;

            ++considered;
            TrainCandidate c = locate(record, board.first, query, now);
            if (c.state == CandidateState::Rejected)
            {
                ++rejected;
                continue;
            }
            located.push_back(std::move(c));
        }
    }

    EstimateResult result = rank(std::move(located));
    result.considered = considered;
    result.rejected = rejected;
    return result;
}
