#include "sdbg/util/table.hh"

#include <algorithm>
#include <ostream>

namespace sdbg {

void printTable(std::ostream & out, const Table & table)
{
    std::vector<size_t> widths;
    for (auto & row : table) {
        widths.resize(std::max(widths.size(), row.size()));
        for (size_t col = 0; col < row.size(); ++col)
            widths[col] = std::max(widths[col], row[col].size());
    }

    for (auto & row : table) {
        for (size_t col = 0; col < row.size(); ++col) {
            auto cell = row[col];
            std::replace(cell.begin(), cell.end(), '\n', ' ');
            out << cell;
            if (col + 1 < row.size())
                out << std::string(widths[col] - cell.size() + 2, ' ');
        }
        out << "\n";
    }
}

} // namespace sdbg
