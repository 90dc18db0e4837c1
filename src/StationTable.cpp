#include "StationTable.hpp"

#include <iostream>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include "Csv.hpp"

StationTable::StationTable(std::string const& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
        throw std::runtime_error("Could not open station table " + filepath);

    std::string line;
    std::getline(file, line);
    auto header = Csv::splitLine(line, ';');
    int evaCol  = Csv::columnIndex(header, "EVA_NR");
    int nameCol = Csv::columnIndex(header, "NAME");
    if (evaCol < 0 || nameCol < 0)
        throw std::runtime_error("Station table " + filepath + " lacks EVA_NR or NAME column");

    std::size_t skipped = 0;
    while (std::getline(file, line))
    {
        if (line.empty()) continue;

        auto row = Csv::splitLine(line, ';');
        if (row.size() <= static_cast<std::size_t>(std::max(evaCol, nameCol)))
        {
            ++skipped;
            continue;
        }

        try
        {
            add(row[nameCol], std::stoll(row[evaCol]));
        }
        catch (std::exception const&)
        {
            ++skipped;
        }
    }

    std::cout << "[Builder] Loaded " << idByName.size() << " station names";
    if (skipped > 0)
        std::cout << " (" << skipped << " malformed rows skipped)";
    std::cout << "\n";
}

void StationTable::add(std::string const& name, StationId id)
{
    idByName[name] = id;
}

std::optional<StationId> StationTable::resolve(std::string const& name) const
{
    auto it = idByName.find(name);
    if (it != idByName.end())
        return it->second;

    it = idByName.find(normalizeName(name));
    if (it != idByName.end())
        return it->second;

    return std::nullopt;
}

std::size_t StationTable::size() const noexcept
{
    return idByName.size();
}

std::string StationTable::normalizeName(std::string const& name)
{
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        if (name[i] == ' ' && i + 1 < name.size() && name[i + 1] == '(')
            continue;
        out += name[i];
    }
    return out;
}
