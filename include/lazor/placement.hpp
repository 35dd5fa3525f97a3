/**
 * @file placement.hpp
 * @brief 可動ブロックの配置（空きセルスロット配列 + Trail によるバックトラック）
 */
#ifndef LAZOR_PLACEMENT_HPP
#define LAZOR_PLACEMENT_HPP

#include "lazor/board.hpp"
#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace lazor {

/**
 * @brief 配置済みブロック（セルと種別）
 */
struct PlacedBlock {
    Cell cell;
    BlockType type;

    bool operator==(const PlacedBlock& other) const {
        return cell == other.cell && type == other.type;
    }
};

/**
 * @brief 盤面の空きセルへの可動ブロック割り当て
 *
 * Board::empty_cells() の順にスロット番号を振り、スロット単位で
 * assign / unassign する。固定セルはスロットを持たないため変更できない。
 * 種別ごとの使用数は在庫を超えない。
 *
 * 固定ブロックと配置ブロックを合わせたセル単位のレイアウトを保持し、
 * 光線追跡からの block_at() を O(1) で返す（= 構成 configuration）。
 *
 * 集中型 Trail: assign の履歴を記録し、save_point() / rewind_to() で
 * 探索の分岐前の状態へ一括で戻す。
 */
class Placement {
public:
    /**
     * @brief 空の配置を作成
     * @note board は Placement より長く生存すること
     */
    explicit Placement(const Board& board);

    const Board& board() const { return *board_; }

    /**
     * @brief スロット数（= 空きセル数）
     */
    size_t slot_count() const { return slots_.size(); }

    /**
     * @brief スロットのセル
     */
    const Cell& slot_cell(size_t slot) const { return board_->empty_cells()[slot]; }

    /**
     * @brief セルのスロット番号（空きセルでなければ nullopt）
     */
    std::optional<size_t> slot_of(const Cell& cell) const;

    /**
     * @brief スロットに置かれたブロック
     */
    std::optional<BlockType> at(size_t slot) const;

    /**
     * @brief セル上のブロック（固定または配置済み、盤外なら nullopt）
     */
    std::optional<BlockType> block_at(const Cell& cell) const {
        if (!board_->in_board(cell)) {
            return std::nullopt;
        }
        auto code = layout_[board_->cell_index(cell)];
        if (code < 0) {
            return std::nullopt;
        }
        return static_cast<BlockType>(code);
    }

    /**
     * @brief スロットにブロックを置く
     * @return 在庫切れ、または既に置かれている場合は false
     */
    bool assign(size_t slot, BlockType type);

    /**
     * @brief セルにブロックを置く（空きセル以外は false）
     */
    bool assign(const Cell& cell, BlockType type);

    /**
     * @brief スロットを空にする
     */
    void unassign(size_t slot);

    /**
     * @brief 全スロットを空にする
     */
    void clear();

    int used(BlockType type) const { return used_[block_index(type)]; }

    int remaining(BlockType type) const {
        return board_->inventory()[type] - used_[block_index(type)];
    }

    /**
     * @brief 配置済みブロック数
     */
    int placed_count() const { return used_[0] + used_[1] + used_[2]; }

    /**
     * @brief 現在の Trail 位置
     */
    size_t save_point() const { return trail_.size(); }

    /**
     * @brief save_point() 以降の assign を全て取り消す
     */
    void rewind_to(size_t point);

    /**
     * @brief 配置済みブロックの一覧（スロット順）
     */
    std::vector<PlacedBlock> entries() const;

private:
    const Board* board_;
    std::vector<int8_t> slots_;           // スロット → ブロック種別（-1: 空）
    std::vector<int> slot_by_cell_;       // セル → スロット（-1: 空きセルでない）
    std::vector<int8_t> layout_;          // セル → ブロック種別（固定 + 配置、-1: なし）
    std::array<int, BLOCK_TYPE_COUNT> used_{};
    std::vector<size_t> trail_;           // assign したスロットの履歴
};

/**
 * @brief 配置一覧から Placement を復元
 * @throws std::invalid_argument 空きセル以外への配置や在庫超過
 */
Placement make_placement(const Board& board, const std::vector<PlacedBlock>& blocks);

} // namespace lazor

#endif // LAZOR_PLACEMENT_HPP
