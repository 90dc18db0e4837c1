#include <cmath>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>
#include <date/tz.h>
#include "ResponseWriter.hpp"
#include "TransitClient.hpp"

using namespace std::chrono;

namespace
{

// boost::json prints doubles in exponent form ("1.23E1"); numbers here are
// written the way a reader expects them ("12.3").
void writeJson(std::ostream& out, boost::json::value const& v)
{
    switch (v.kind())
    {
    case boost::json::kind::double_:
    {
        std::ostringstream number;
        number << std::setprecision(15) << v.get_double();
        std::string text = number.str();
        if (std::isfinite(v.get_double()) && text.find_first_of(".e") == std::string::npos)
            text += ".0";
        out << text;
        break;
    }
    case boost::json::kind::array:
    {
        out << '[';
        bool first = true;
        for (auto const& item : v.get_array())
        {
            if (!first) out << ',';
            first = false;
            writeJson(out, item);
        }
        out << ']';
        break;
    }
    case boost::json::kind::object:
    {
        out << '{';
        bool first = true;
        for (auto const& field : v.get_object())
        {
            if (!first) out << ',';
            first = false;
            out << boost::json::serialize(boost::json::value(field.key())) << ':';
            writeJson(out, field.value());
        }
        out << '}';
        break;
    }
    default:
        out << boost::json::serialize(v);
    }
}

}

std::string ResponseWriter::formatClock(std::time_t t, std::string const& timeZone)
{
    auto zone = date::locate_zone(timeZone);
    date::zoned_seconds local{zone, date::sys_seconds{seconds{t}}};
    return date::format("%H:%M", local);
}

std::string ResponseWriter::searchBody(StationIdSet const& evas,
                                       std::vector<TrainCandidate> const& trains,
                                       std::string const& timeZone)
{
    boost::json::array evaList;
    for (StationId id : evas)
        evaList.emplace_back(id);

    boost::json::array trainList;
    for (TrainCandidate const& t : trains)
    {
        boost::json::object train;
        train["line"] = t.line;
        train["train"] = t.trainNumber;
        train["tripId"] = t.tripId;
        train["location"] = boost::json::array{t.location.lat, t.location.lon};
        train["distance"] = std::round(t.distanceKm * 10.0) / 10.0;
        train["likelihood"] = static_cast<std::int64_t>(std::lround(t.likelihood));
        train["stops"] = boost::json::array{
            boost::json::array{t.previous.id, t.previous.name, formatClock(t.previousDeparture, timeZone)},
            boost::json::array{t.next.id, t.next.name, formatClock(t.nextArrival, timeZone)}
        };
        trainList.push_back(std::move(train));
    }

    boost::json::object body;
    body["evas"] = std::move(evaList);
    body["trains"] = std::move(trainList);

    std::ostringstream out;
    writeJson(out, body);
    return out.str();
}

std::string ResponseWriter::degradedBody(std::string const& error)
{
    boost::json::object body;
    body["error"] = error;
    body["evas"] = boost::json::array{};
    body["trains"] = boost::json::array{};
    return boost::json::serialize(body);
}

std::string ResponseWriter::statsBody(RequestCounters const& counters)
{
    boost::json::object body;
    body["arrivals_request_count"] = counters.arrivals.load(std::memory_order_relaxed);
    body["polyline_request_count"] = counters.polylines.load(std::memory_order_relaxed);
    return boost::json::serialize(body);
}
