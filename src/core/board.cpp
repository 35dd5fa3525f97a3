#include "lazor/board.hpp"
#include <stdexcept>

namespace lazor {

char block_symbol(BlockType type) {
    switch (type) {
    case BlockType::Reflect: return 'A';
    case BlockType::Opaque:  return 'B';
    case BlockType::Refract: return 'C';
    }
    return '?';
}

const char* block_name(BlockType type) {
    switch (type) {
    case BlockType::Reflect: return "reflect";
    case BlockType::Opaque:  return "opaque";
    case BlockType::Refract: return "refract";
    }
    return "unknown";
}

std::optional<BlockType> block_from_symbol(char symbol) {
    switch (symbol) {
    case 'A': case 'a': return BlockType::Reflect;
    case 'B': case 'b': return BlockType::Opaque;
    case 'C': case 'c': return BlockType::Refract;
    default: return std::nullopt;
    }
}

std::string to_string(const Point& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

std::string to_string(const Cell& cell) {
    return "[" + std::to_string(cell.row) + ", " + std::to_string(cell.col) + "]";
}

Board::Board(int width, int height, std::vector<CellSpec> cells, Inventory inventory,
             std::vector<Laser> lasers, std::vector<Point> targets)
    : width_(width)
    , height_(height)
    , cells_(std::move(cells))
    , inventory_(inventory)
    , lasers_(std::move(lasers))
    , targets_(std::move(targets)) {
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("board dimensions must be positive: " +
                                    std::to_string(width_) + "x" + std::to_string(height_));
    }
    if (cells_.size() != static_cast<size_t>(width_) * static_cast<size_t>(height_)) {
        throw std::invalid_argument("board has " + std::to_string(cells_.size()) +
                                    " cells, expected " + std::to_string(width_ * height_));
    }

    for (int row = 0; row < height_; ++row) {
        for (int col = 0; col < width_; ++col) {
            const auto& spec = cells_[cell_index({row, col})];
            if (spec.kind == CellKind::Empty) {
                empty_cells_.push_back({row, col});
            } else if (spec.kind == CellKind::Fixed) {
                fixed_count_++;
            }
        }
    }

    for (auto type : ALL_BLOCK_TYPES) {
        if (inventory_[type] < 0) {
            throw std::invalid_argument(std::string("negative inventory for block ") +
                                        block_symbol(type));
        }
    }
    // 在庫は全て配置可能でなければならない
    if (static_cast<size_t>(inventory_.total()) > empty_cells_.size()) {
        throw std::invalid_argument("inventory of " + std::to_string(inventory_.total()) +
                                    " blocks exceeds " + std::to_string(empty_cells_.size()) +
                                    " empty cells");
    }

    for (const auto& laser : lasers_) {
        if (!in_lattice(laser.origin)) {
            throw std::invalid_argument("laser origin " + to_string(laser.origin) +
                                        " is outside the lattice");
        }
        if ((laser.dx != 1 && laser.dx != -1) || (laser.dy != 1 && laser.dy != -1)) {
            throw std::invalid_argument("laser at " + to_string(laser.origin) +
                                        " must travel diagonally, got direction (" +
                                        std::to_string(laser.dx) + ", " +
                                        std::to_string(laser.dy) + ")");
        }
    }
    for (const auto& target : targets_) {
        if (!in_lattice(target)) {
            throw std::invalid_argument("target " + to_string(target) +
                                        " is outside the lattice");
        }
    }
}

std::optional<Cell> Board::cell_at_center(const Point& p) const {
    if (p.x % 2 != 1 || p.y % 2 != 1) {
        return std::nullopt;
    }
    Cell cell{(p.y - 1) / 2, (p.x - 1) / 2};
    if (!in_board(cell)) {
        return std::nullopt;
    }
    return cell;
}

std::optional<BlockType> Board::fixed_block(const Cell& cell) const {
    if (!in_board(cell)) {
        return std::nullopt;
    }
    const auto& spec = cells_[cell_index(cell)];
    if (spec.kind != CellKind::Fixed) {
        return std::nullopt;
    }
    return spec.block;
}

} // namespace lazor
