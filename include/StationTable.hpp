#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include "Types.hpp"

class StationTable
{
private:
    std::unordered_map<std::string, StationId> idByName;

public:
    StationTable() = default;
    explicit StationTable(std::string const& filepath);

    void add(std::string const& name, StationId id);
    std::optional<StationId> resolve(std::string const& name) const;
    std::size_t size() const noexcept;

    // "Frankfurt (Main) Hbf" -> "Frankfurt(Main) Hbf"
    static std::string normalizeName(std::string const& name);
};
