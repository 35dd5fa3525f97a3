#include "lazor/placement.hpp"
#include <algorithm>
#include <stdexcept>

namespace lazor {

Placement::Placement(const Board& board)
    : board_(&board)
    , slots_(board.empty_cells().size(), -1)
    , slot_by_cell_(board.cells().size(), -1)
    , layout_(board.cells().size(), -1) {
    const auto& empty = board.empty_cells();
    for (size_t i = 0; i < empty.size(); ++i) {
        slot_by_cell_[board.cell_index(empty[i])] = static_cast<int>(i);
    }
    const auto& cells = board.cells();
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].kind == CellKind::Fixed) {
            layout_[i] = static_cast<int8_t>(cells[i].block);
        }
    }
}

std::optional<size_t> Placement::slot_of(const Cell& cell) const {
    if (!board_->in_board(cell)) {
        return std::nullopt;
    }
    int slot = slot_by_cell_[board_->cell_index(cell)];
    if (slot < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(slot);
}

std::optional<BlockType> Placement::at(size_t slot) const {
    if (slot >= slots_.size() || slots_[slot] < 0) {
        return std::nullopt;
    }
    return static_cast<BlockType>(slots_[slot]);
}

bool Placement::assign(size_t slot, BlockType type) {
    if (slot >= slots_.size() || slots_[slot] >= 0) {
        return false;
    }
    if (remaining(type) <= 0) {
        return false;
    }
    slots_[slot] = static_cast<int8_t>(type);
    layout_[board_->cell_index(slot_cell(slot))] = static_cast<int8_t>(type);
    used_[block_index(type)]++;
    trail_.push_back(slot);
    return true;
}

bool Placement::assign(const Cell& cell, BlockType type) {
    auto slot = slot_of(cell);
    if (!slot) {
        return false;
    }
    return assign(*slot, type);
}

void Placement::unassign(size_t slot) {
    if (slot >= slots_.size() || slots_[slot] < 0) {
        return;
    }
    used_[static_cast<size_t>(slots_[slot])]--;
    slots_[slot] = -1;
    layout_[board_->cell_index(slot_cell(slot))] = -1;

    // 通常は末尾（直前の assign）
    if (!trail_.empty() && trail_.back() == slot) {
        trail_.pop_back();
    } else {
        trail_.erase(std::remove(trail_.begin(), trail_.end(), slot), trail_.end());
    }
}

void Placement::clear() {
    rewind_to(0);
}

void Placement::rewind_to(size_t point) {
    while (trail_.size() > point) {
        unassign(trail_.back());
    }
}

std::vector<PlacedBlock> Placement::entries() const {
    std::vector<PlacedBlock> result;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] >= 0) {
            result.push_back({slot_cell(i), static_cast<BlockType>(slots_[i])});
        }
    }
    return result;
}

Placement make_placement(const Board& board, const std::vector<PlacedBlock>& blocks) {
    Placement placement(board);
    for (const auto& block : blocks) {
        if (!placement.assign(block.cell, block.type)) {
            throw std::invalid_argument("cannot place block " +
                                        std::string(1, block_symbol(block.type)) +
                                        " at cell " + to_string(block.cell));
        }
    }
    return placement;
}

} // namespace lazor
