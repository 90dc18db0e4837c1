#pragma once
#include <string>
#include <vector>

class Csv
{
public:
    // Splits one line, honouring double-quoted fields and "" escapes.
    static std::vector<std::string> splitLine(std::string const& line, char separator = ',');

    // Position of a header column, or -1 when absent.
    static int columnIndex(std::vector<std::string> const& header, std::string const& name);
};
