#include "Csv.hpp"

std::vector<std::string> Csv::splitLine(std::string const& line, char separator)
{
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (quoted)
        {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
            {
                current += '"';
                ++i;
            }
            else if (c == '"')
            {
                quoted = false;
            }
            else
            {
                current += c;
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == separator)
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else if (c != '\r')
        {
            current += c;
        }
    }
    fields.push_back(std::move(current));

    return fields;
}

int Csv::columnIndex(std::vector<std::string> const& header, std::string const& name)
{
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        std::string column = header[i];
        // UTF-8 byte order mark on the first column
        if (i == 0 && column.rfind("\xEF\xBB\xBF", 0) == 0)
            column = column.substr(3);
        if (column == name)
            return static_cast<int>(i);
    }
    return -1;
}
