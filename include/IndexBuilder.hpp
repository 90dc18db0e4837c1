#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"
#include "GtfsReader.hpp"
#include "StationTable.hpp"

class IndexBuilder
{
private:
    StationTable const& stations;
    double spacingMeters;
    CandidateStationSet index;
    std::size_t unresolvedNames = 0;
    std::size_t tripsRegistered = 0;
    std::size_t legsRegistered = 0;

    void registerPair(GridCell cell, std::optional<StationId> a, std::optional<StationId> b);

public:
    static constexpr double DEFAULT_SPACING_METERS = 100.0;

    explicit IndexBuilder(StationTable const& stations, double spacingMeters = DEFAULT_SPACING_METERS);

    // Densifies every shape once and registers all trips running over it.
    void addRoutes(StaticRoutes const& routes);

    // shape must already be densified. Throws DataIntegrityError when the stops
    // do not bracket the shape consistently.
    void addTrip(Shape const& shape, TripStopSequence const& stops, std::string const& tripId);

    void addPolyline(std::vector<PolylineVertex> const& vertices);

    [[nodiscard]] CandidateStationSet const& cells() const noexcept;
    [[nodiscard]] std::size_t unresolvedNameCount() const noexcept;
    [[nodiscard]] std::size_t tripCount() const noexcept;
    [[nodiscard]] std::size_t legCount() const noexcept;
};
