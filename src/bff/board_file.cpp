#include "lazor/bff/board_file.hpp"
#include <limits>
#include <stdexcept>

namespace lazor {
namespace bff {

namespace {
int to_coord(long long v, const char* what, int line) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(what) + " on line " + std::to_string(line) +
                                    " is out of range");
    }
    return static_cast<int>(v);
}
}  // namespace

bool is_cell_symbol(char symbol) {
    switch (symbol) {
    case 'o': case 'x': case 'A': case 'B': case 'C':
        return true;
    default:
        return false;
    }
}

Board BoardFile::to_board() const {
    int height = static_cast<int>(grid_.size());
    int width = grid_.empty() ? 0 : static_cast<int>(grid_.front().size());

    std::vector<CellSpec> cells;
    cells.reserve(static_cast<size_t>(width) * static_cast<size_t>(height));
    for (const auto& row : grid_) {
        for (char symbol : row) {
            if (symbol == 'o') {
                cells.push_back(CellSpec::empty());
            } else if (symbol == 'x') {
                cells.push_back(CellSpec::forbidden());
            } else if (auto type = block_from_symbol(symbol)) {
                cells.push_back(CellSpec::fixed(*type));
            } else {
                throw std::invalid_argument(std::string("unknown cell symbol '") + symbol + "'");
            }
        }
    }

    std::vector<Laser> lasers;
    for (const auto& decl : lasers_) {
        lasers.push_back({{to_coord(decl.x, "laser x", decl.line),
                           to_coord(decl.y, "laser y", decl.line)},
                          to_coord(decl.dx, "laser vx", decl.line),
                          to_coord(decl.dy, "laser vy", decl.line)});
    }

    std::vector<Point> targets;
    for (const auto& decl : targets_) {
        targets.push_back({to_coord(decl.x, "target x", decl.line),
                           to_coord(decl.y, "target y", decl.line)});
    }

    return Board(width, height, std::move(cells), inventory_, std::move(lasers),
                 std::move(targets));
}

Board load_board(const std::string& filename) {
    return parse_file(filename)->to_board();
}

} // namespace bff
} // namespace lazor
