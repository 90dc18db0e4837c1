#include "gtest/gtest.h"

#include <string>

#include "PositionEstimator.hpp"

namespace {

constexpr std::time_t T = 1714557780;

Station const A{1, "Alpha", {52.0, 13.0}};
Station const B{2, "Bravo", {52.0, 13.2}};
Station const C{3, "Charlie", {52.0, 13.4}};
Station const Z{4, "Zulu", {52.0, 12.8}};

StopoverEvent departingFrom(Station const& s, std::time_t departure)
{
    StopoverEvent e;
    e.station = s;
    e.plannedDeparture = departure;
    e.departure = departure;
    return e;
}

StopoverEvent passing(Station const& s, std::time_t arrival, std::time_t departure)
{
    StopoverEvent e = departingFrom(s, departure);
    e.plannedArrival = arrival;
    e.arrival = arrival;
    return e;
}

// Arrival at `to`, coming from the given stopovers.
ArrivalRecord arrivalAt(Station const& to, std::time_t when, std::vector<StopoverEvent> previous,
                        std::string const& trainNumber = "1001")
{
    ArrivalRecord r;
    r.tripId = "trip-" + trainNumber;
    r.line = "ICE " + trainNumber;
    r.trainNumber = trainNumber;
    r.stop = to;
    r.plannedWhen = when;
    r.when = when;
    r.delay = 0;
    r.previousStopovers = std::move(previous);
    return r;
}

TrainCandidate ranked(std::string const& trainNumber, double distanceKm, bool preferred = false)
{
    TrainCandidate c;
    c.tripId = "trip-" + trainNumber;
    c.trainNumber = trainNumber;
    c.distanceKm = distanceKm;
    c.preferred = preferred;
    c.state = CandidateState::LocationComputed;
    return c;
}

}  // namespace

TEST(position_estimator, train_halfway_between_stations)
{
    PositionEstimator estimator;
    ArrivalBoards boards;
    boards[B.id].push_back(arrivalAt(B, T + 600, {departingFrom(Z, T - 600), passing(A, T - 60, T)}));

    EstimateResult result = estimator.estimate({52.0, 13.1}, {Z.id, A.id, B.id}, boards, T + 300);

    ASSERT_EQ(1u, result.trains.size());
    TrainCandidate const& train = result.trains[0];
    EXPECT_DOUBLE_EQ(0.5, train.progress);
    EXPECT_NEAR(52.0, train.location.lat, 1e-9);
    EXPECT_NEAR(13.1, train.location.lon, 1e-9);
    EXPECT_LT(train.distanceKm, 0.01);
    EXPECT_GT(train.likelihood, 99.9);
    EXPECT_TRUE(train.preferred);
    EXPECT_EQ(CandidateState::Emitted, train.state);
    EXPECT_EQ(1u, train.legIndex);
    EXPECT_EQ(A.id, train.previous.id);
    EXPECT_EQ(B.id, train.next.id);
    EXPECT_EQ(T, train.previousDeparture);
    EXPECT_EQ(T + 600, train.nextArrival);
    EXPECT_EQ(1u, result.considered);
    EXPECT_EQ(0u, result.rejected);
}

TEST(position_estimator, train_not_yet_departed_is_excluded)
{
    PositionEstimator estimator;
    ArrivalBoards boards;
    boards[B.id].push_back(arrivalAt(B, T + 1800, {departingFrom(Z, T + 600), passing(A, T + 1100, T + 1200)}));

    EstimateResult result = estimator.estimate({52.0, 13.1}, {Z.id, A.id, B.id}, boards, T);

    EXPECT_TRUE(result.trains.empty());
    EXPECT_EQ(1u, result.considered);
    EXPECT_EQ(1u, result.rejected);
}

TEST(position_estimator, imminent_departure_waits_at_first_station)
{
    PositionEstimator estimator;
    ArrivalBoards boards;
    boards[B.id].push_back(arrivalAt(B, T + 1400, {departingFrom(Z, T + 200), passing(A, T + 800, T + 860)}));

    EstimateResult result = estimator.estimate({52.0, 12.9}, {Z.id, A.id, B.id}, boards, T);

    ASSERT_EQ(1u, result.trains.size());
    EXPECT_DOUBLE_EQ(0.0, result.trains[0].progress);
    EXPECT_DOUBLE_EQ(Z.location.lat, result.trains[0].location.lat);
    EXPECT_DOUBLE_EQ(Z.location.lon, result.trains[0].location.lon);
}

TEST(position_estimator, arrived_train_is_rejected)
{
    PositionEstimator estimator;
    ArrivalRecord r = arrivalAt(B, T + 600, {departingFrom(A, T)});

    TrainCandidate c = estimator.locate(r, B.id, {52.0, 13.1}, T + 900);
    EXPECT_EQ(CandidateState::Rejected, c.state);
}

TEST(position_estimator, progress_ratio_bounds)
{
    EXPECT_DOUBLE_EQ(0.5, PositionEstimator::progressRatio(T, T + 600, T + 300));
    EXPECT_DOUBLE_EQ(0.0, PositionEstimator::progressRatio(T, T + 600, T - 60));
    EXPECT_DOUBLE_EQ(1.0, PositionEstimator::progressRatio(T, T + 600, T + 700));
    EXPECT_DOUBLE_EQ(0.0, PositionEstimator::progressRatio(T, T, T - 1));
    EXPECT_DOUBLE_EQ(1.0, PositionEstimator::progressRatio(T, T, T));
    EXPECT_DOUBLE_EQ(1.0, PositionEstimator::progressRatio(T + 60, T, T + 30));
}

TEST(position_estimator, likelihood_falls_with_distance)
{
    PositionEstimator estimator;
    EXPECT_DOUBLE_EQ(100.0, estimator.likelihood(0.0));
    EXPECT_DOUBLE_EQ(50.0, estimator.likelihood(25.0));
    EXPECT_DOUBLE_EQ(0.0, estimator.likelihood(50.0));

    double last = estimator.likelihood(0.0);
    for (double d = 0.5; d < 50.0; d += 0.5)
    {
        double l = estimator.likelihood(d);
        EXPECT_LT(l, last);
        last = l;
    }
}

TEST(position_estimator, delay_fills_missing_realtime)
{
    ArrivalRecord r;
    r.stop = C;
    r.plannedWhen = T + 1200;
    r.delay = 120;

    StopoverEvent plannedOnly;
    plannedOnly.station = A;
    plannedOnly.plannedDeparture = T;

    StopoverEvent unchanged;
    unchanged.station = B;
    unchanged.plannedArrival = T + 600;
    unchanged.arrival = T + 600;
    unchanged.plannedDeparture = T + 660;
    unchanged.departure = T + 900;

    r.previousStopovers = {plannedOnly, unchanged};

    std::vector<StopoverEvent> stops = PositionEstimator::normalizeStopovers(r);
    ASSERT_EQ(3u, stops.size());
    EXPECT_EQ(T + 120, *stops[0].departure);
    EXPECT_FALSE(stops[0].arrival);
    EXPECT_EQ(T + 720, *stops[1].arrival);
    EXPECT_EQ(T + 900, *stops[1].departure);
    EXPECT_EQ(C.id, stops[2].station.id);
    EXPECT_EQ(T + 1320, *stops[2].arrival);
}

TEST(position_estimator, needs_two_nearby_previous_stopovers)
{
    PositionEstimator estimator;

    // The queried station itself does not count toward the two.
    ArrivalBoards single;
    single[B.id].push_back(arrivalAt(B, T + 600, {departingFrom(A, T)}));
    EstimateResult one = estimator.estimate({52.0, 13.1}, {A.id, B.id}, single, T + 300);
    EXPECT_TRUE(one.trains.empty());
    EXPECT_EQ(0u, one.considered);

    ArrivalBoards farOrigin;
    farOrigin[B.id].push_back(arrivalAt(B, T + 600, {departingFrom(Z, T - 600), passing(A, T - 60, T)}));
    EstimateResult partial = estimator.estimate({52.0, 13.1}, {A.id, B.id}, farOrigin, T + 300);
    EXPECT_TRUE(partial.trains.empty());
    EXPECT_EQ(0u, partial.considered);

    EstimateResult both = estimator.estimate({52.0, 13.1}, {Z.id, A.id, B.id}, farOrigin, T + 300);
    EXPECT_EQ(1u, both.considered);
    EXPECT_EQ(1u, both.trains.size());
}

TEST(position_estimator, traversal_leg_must_be_closest_leg)
{
    ArrivalBoards boards;
    boards[C.id].push_back(arrivalAt(C, T + 1200, {departingFrom(A, T), passing(B, T + 600, T + 660)}));
    Coordinate beyondC{52.0, 13.6};

    PositionEstimator segment;
    EstimateResult clamped = segment.estimate(beyondC, {A.id, B.id, C.id}, boards, T + 300);
    EXPECT_TRUE(clamped.trains.empty());
    EXPECT_EQ(1u, clamped.rejected);

    EstimatorOptions options;
    options.metric = LegMetric::Perpendicular;
    PositionEstimator perpendicular(options);
    EstimateResult unclamped = perpendicular.estimate(beyondC, {A.id, B.id, C.id}, boards, T + 300);
    ASSERT_EQ(1u, unclamped.trains.size());
    EXPECT_EQ(A.id, unclamped.trains[0].previous.id);
    EXPECT_FALSE(unclamped.trains[0].preferred);
}

TEST(position_estimator, preferred_detection_wins_dedup)
{
    PositionEstimator estimator;
    std::vector<TrainCandidate> candidates{
        ranked("1001", 5.0),
        ranked("1001", 8.0, true),
        ranked("2002", 3.0)
    };

    EstimateResult result = estimator.rank(candidates);

    ASSERT_EQ(2u, result.trains.size());
    EXPECT_EQ("2002", result.trains[0].trainNumber);
    EXPECT_EQ("1001", result.trains[1].trainNumber);
    EXPECT_TRUE(result.trains[1].preferred);
    EXPECT_DOUBLE_EQ(8.0, result.trains[1].distanceKm);
    EXPECT_EQ(1u, result.droppedByDedup);
}

TEST(position_estimator, missing_train_number_falls_back_to_trip)
{
    PositionEstimator estimator;
    TrainCandidate first = ranked("", 1.0);
    first.tripId = "trip-a";
    TrainCandidate second = ranked("", 2.0);
    second.tripId = "trip-b";

    EstimateResult result = estimator.rank({first, second});
    EXPECT_EQ(2u, result.trains.size());
    EXPECT_EQ(0u, result.droppedByDedup);
}

TEST(position_estimator, distant_trains_are_dropped)
{
    PositionEstimator estimator;
    EstimateResult result = estimator.rank({ranked("1001", 49.9), ranked("2002", 60.0), ranked("3003", 50.0)});

    ASSERT_EQ(1u, result.trains.size());
    EXPECT_EQ("1001", result.trains[0].trainNumber);
    EXPECT_EQ(2u, result.droppedByDistance);
}

TEST(position_estimator, keeps_ten_closest)
{
    PositionEstimator estimator;
    std::vector<TrainCandidate> candidates;
    for (int i = 12; i >= 1; --i)
        candidates.push_back(ranked(std::to_string(i), static_cast<double>(i)));

    EstimateResult result = estimator.rank(candidates);

    ASSERT_EQ(10u, result.trains.size());
    for (std::size_t i = 0; i < result.trains.size(); ++i)
    {
        EXPECT_EQ(std::to_string(i + 1), result.trains[i].trainNumber);
        EXPECT_EQ(CandidateState::Emitted, result.trains[i].state);
    }
    EXPECT_EQ(2u, result.droppedByDistance);
}
