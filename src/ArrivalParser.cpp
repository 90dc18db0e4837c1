#include "ArrivalParser.hpp"

#include <iostream>
#include <sstream>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <date/date.h>
#include "Errors.hpp"

namespace
{

boost::json::value parseBody(std::string const& data)
{
    if (data.empty() || data[0] == '<')
        throw UpstreamFetchError("upstream returned no JSON");

    boost::system::error_code ec;
    boost::json::value root = boost::json::parse(data, ec);
    if (ec)
        throw UpstreamFetchError("malformed upstream JSON: " + ec.message());
    return root;
}

std::string stringField(boost::json::object const& obj, char const* key)
{
    auto const* v = obj.if_contains(key);
    if (!v || v->is_null())
        return {};
    if (v->is_string())
        return std::string(v->get_string());
    if (v->is_int64())
        return std::to_string(v->get_int64());
    return {};
}

std::optional<StationId> numericId(std::string const& text)
{
    if (text.empty() || text.size() > 18)
        return std::nullopt;
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
        return std::nullopt;
    return std::stoll(text);
}

}

std::optional<std::time_t> ArrivalParser::parseTime(boost::json::value const* value)
{
    if (!value || !value->is_string())
        return std::nullopt;

    std::string text(value->get_string());
    date::sys_seconds tp;

    std::istringstream in(text);
    in >> date::parse("%FT%T%Ez", tp);
    if (in.fail())
    {
        std::istringstream utc(text);
        utc >> date::parse("%FT%TZ", tp);
        if (utc.fail())
            throw std::invalid_argument("unparseable timestamp " + text);
    }

    return static_cast<std::time_t>(tp.time_since_epoch().count());
}

Station ArrivalParser::parseStation(boost::json::value const& stop)
{
    auto const& obj = stop.as_object();

    Station station;
    std::string id = stringField(obj, "id");
    auto numeric = numericId(id);
    if (!numeric)
        throw std::invalid_argument("non-numeric station id '" + id + "'");
    station.id = *numeric;
    station.name = stringField(obj, "name");

    auto const& location = obj.at("location").as_object();
    station.location.lat = location.at("latitude").to_number<double>();
    station.location.lon = location.at("longitude").to_number<double>();
    return station;
}

StopoverEvent ArrivalParser::parseStopover(boost::json::object const& entry)
{
    StopoverEvent event;
    event.station          = parseStation(entry.at("stop"));
    event.plannedArrival   = parseTime(entry.if_contains("plannedArrival"));
    event.arrival          = parseTime(entry.if_contains("arrival"));
    event.plannedDeparture = parseTime(entry.if_contains("plannedDeparture"));
    event.departure        = parseTime(entry.if_contains("departure"));
    return event;
}

ArrivalRecord ArrivalParser::parseRecord(boost::json::object const& entry)
{
    ArrivalRecord record;
    record.tripId = stringField(entry, "tripId");
    record.stop = parseStation(entry.at("stop"));
    record.plannedWhen = parseTime(entry.if_contains("plannedWhen"));
    record.when = parseTime(entry.if_contains("when"));

    if (auto const* delay = entry.if_contains("delay"); delay && delay->is_number())
        record.delay = static_cast<int>(delay->to_number<double>());

    if (auto const* line = entry.if_contains("line"); line && line->is_object())
    {
        record.line = stringField(line->get_object(), "name");
        record.trainNumber = stringField(line->get_object(), "fahrtNr");
    }

    if (auto const* previous = entry.if_contains("previousStopovers"); previous && previous->is_array())
    {
        for (auto const& s : previous->get_array())
            record.previousStopovers.push_back(parseStopover(s.as_object()));
    }

    return record;
}

std::vector<ArrivalRecord> ArrivalParser::extractArrivals(std::string const& data)
{
    boost::json::value root = parseBody(data);

    boost::json::array const* entries = nullptr;
    if (root.is_array())
        entries = &root.get_array();
    else if (root.is_object())
    {
        auto const* arrivals = root.get_object().if_contains("arrivals");
        if (arrivals && arrivals->is_array())
            entries = &arrivals->get_array();
    }

    if (!entries)
        throw UpstreamFetchError("upstream arrivals body has no arrivals list");

    std::vector<ArrivalRecord> out;
    out.reserve(entries->size());

    for (auto const& entry : *entries)
    {
        try
        {
            ArrivalRecord record = parseRecord(entry.as_object());
            if (record.tripId.empty())
                continue;
            out.push_back(std::move(record));
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Upstream] Skipping malformed arrival: " << e.what() << "\n";
        }
    }

    return out;
}

boost::json::value ArrivalParser::extractTripPolyline(std::string const& data)
{
    boost::json::value root = parseBody(data);

    if (root.is_object())
    {
        boost::json::object const* trip = &root.get_object();
        if (auto const* inner = trip->if_contains("trip"); inner && inner->is_object())
            trip = &inner->get_object();

        if (auto const* polyline = trip->if_contains("polyline"); polyline && polyline->is_object())
            return *polyline;
    }

    throw UpstreamFetchError("upstream trip body has no polyline");
}

std::vector<PolylineVertex> ArrivalParser::extractVertices(boost::json::value const& featureCollection)
{
    std::vector<PolylineVertex> vertices;

    auto const* features = featureCollection.as_object().if_contains("features");
    if (!features || !features->is_array())
        return vertices;

    for (auto const& f : features->get_array())
    {
        auto const& feature = f.as_object();
        auto const* geometry = feature.if_contains("geometry");
        if (!geometry || !geometry->is_object())
            continue;

        auto const* coordinates = geometry->get_object().if_contains("coordinates");
        if (!coordinates || !coordinates->is_array() || coordinates->get_array().size() < 2)
            continue;

        // GeoJSON order is [lon, lat]
        PolylineVertex v;
        v.lon = coordinates->get_array()[0].to_number<double>();
        v.lat = coordinates->get_array()[1].to_number<double>();

        if (auto const* props = feature.if_contains("properties"); props && props->is_object())
        {
            v.station = numericId(stringField(props->get_object(), "id"));
        }

        vertices.push_back(v);
    }

    return vertices;
}
