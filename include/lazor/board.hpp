/**
 * @file board.hpp
 * @brief 盤面モデル（格子座標、セル種別、ブロック在庫、レーザー、ターゲット）
 */
#ifndef LAZOR_BOARD_HPP
#define LAZOR_BOARD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lazor {

/**
 * @brief ブロック種別
 */
enum class BlockType : uint8_t {
    Reflect,  // A: 反射
    Opaque,   // B: 吸収
    Refract   // C: 透過 + 反射（分岐）
};

/// ブロック種別の数
static constexpr size_t BLOCK_TYPE_COUNT = 3;

/// 全ブロック種別（列挙順）
static constexpr std::array<BlockType, BLOCK_TYPE_COUNT> ALL_BLOCK_TYPES = {
    BlockType::Reflect, BlockType::Opaque, BlockType::Refract
};

/**
 * @brief ブロック種別の配列インデックス
 */
inline size_t block_index(BlockType type) { return static_cast<size_t>(type); }

/**
 * @brief ブロック種別の盤面記号（'A' / 'B' / 'C'）
 */
char block_symbol(BlockType type);

/**
 * @brief ブロック種別名（"reflect" / "opaque" / "refract"）
 */
const char* block_name(BlockType type);

/**
 * @brief 盤面記号からブロック種別を取得（大文字小文字を区別しない）
 */
std::optional<BlockType> block_from_symbol(char symbol);

/**
 * @brief 倍解像度格子上の点
 *
 * 幅 W, 高さ H の盤面は (2W+1) x (2H+1) の格子で表す。
 * 偶数-偶数の点が格子交点、奇数-奇数の点がセル中心。
 */
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
    bool operator<(const Point& other) const {
        return y != other.y ? y < other.y : x < other.x;
    }
};

/**
 * @brief 盤面のセル（行・列）
 */
struct Cell {
    int row = 0;
    int col = 0;

    /**
     * @brief セル中心の格子座標
     */
    Point center() const { return {2 * col + 1, 2 * row + 1}; }

    bool operator==(const Cell& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Cell& other) const { return !(*this == other); }
    bool operator<(const Cell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

/**
 * @brief セル種別
 */
enum class CellKind : uint8_t {
    Empty,      // o: ブロックを置ける
    Forbidden,  // x: 何も置けない
    Fixed       // A/B/C: 固定ブロック
};

/**
 * @brief セルの内容
 */
struct CellSpec {
    CellKind kind = CellKind::Empty;
    BlockType block = BlockType::Reflect;  // kind == Fixed のときのみ有効

    static CellSpec empty() { return {CellKind::Empty, BlockType::Reflect}; }
    static CellSpec forbidden() { return {CellKind::Forbidden, BlockType::Reflect}; }
    static CellSpec fixed(BlockType type) { return {CellKind::Fixed, type}; }
};

/**
 * @brief レーザー（始点と斜め方向）
 */
struct Laser {
    Point origin;
    int dx = 1;  // -1 or +1
    int dy = 1;  // -1 or +1
};

/**
 * @brief 可動ブロックの在庫（種別ごとの個数）
 */
class Inventory {
public:
    Inventory() = default;
    Inventory(int reflect, int opaque, int refract)
        : counts_{reflect, opaque, refract} {}

    int& operator[](BlockType type) { return counts_[block_index(type)]; }
    int operator[](BlockType type) const { return counts_[block_index(type)]; }

    /**
     * @brief 全種別の合計個数
     */
    int total() const { return counts_[0] + counts_[1] + counts_[2]; }

    bool operator==(const Inventory& other) const { return counts_ == other.counts_; }
    bool operator!=(const Inventory& other) const { return counts_ != other.counts_; }

private:
    std::array<int, BLOCK_TYPE_COUNT> counts_{};
};

/**
 * @brief パズル盤面（構築後は不変）
 *
 * 構築時に整合性を検証し、不正な入力は std::invalid_argument を送出する。
 * 探索・光線追跡は検証済みの Board のみを扱う。
 */
class Board {
public:
    /**
     * @brief 盤面を構築
     * @param width 列数 W
     * @param height 行数 H
     * @param cells 行優先の W*H 個のセル
     * @param inventory 可動ブロックの在庫
     * @param lasers レーザーのリスト
     * @param targets ターゲット点のリスト
     * @throws std::invalid_argument 寸法・座標・在庫が不正な場合
     */
    Board(int width, int height, std::vector<CellSpec> cells, Inventory inventory,
          std::vector<Laser> lasers, std::vector<Point> targets);

    int width() const { return width_; }
    int height() const { return height_; }

    /**
     * @brief 格子の幅（2W+1）
     */
    int lattice_width() const { return 2 * width_ + 1; }

    /**
     * @brief 格子の高さ（2H+1）
     */
    int lattice_height() const { return 2 * height_ + 1; }

    /**
     * @brief 格子点の総数
     */
    size_t lattice_size() const {
        return static_cast<size_t>(lattice_width()) * static_cast<size_t>(lattice_height());
    }

    bool in_board(const Cell& cell) const {
        return cell.row >= 0 && cell.row < height_ && cell.col >= 0 && cell.col < width_;
    }

    bool in_lattice(const Point& p) const {
        return p.x >= 0 && p.x <= 2 * width_ && p.y >= 0 && p.y <= 2 * height_;
    }

    /**
     * @brief セルの行優先インデックス
     * @pre in_board(cell)
     */
    size_t cell_index(const Cell& cell) const {
        return static_cast<size_t>(cell.row) * static_cast<size_t>(width_) +
               static_cast<size_t>(cell.col);
    }

    /**
     * @brief 格子点の行優先インデックス
     * @pre in_lattice(p)
     */
    size_t lattice_index(const Point& p) const {
        return static_cast<size_t>(p.y) * static_cast<size_t>(lattice_width()) +
               static_cast<size_t>(p.x);
    }

    /**
     * @brief セル中心座標からセルを取得（奇数-奇数でなければ nullopt）
     */
    std::optional<Cell> cell_at_center(const Point& p) const;

    CellKind kind(const Cell& cell) const { return cells_[cell_index(cell)].kind; }

    /**
     * @brief 固定ブロックの種別（固定セルでなければ nullopt）
     */
    std::optional<BlockType> fixed_block(const Cell& cell) const;

    const std::vector<CellSpec>& cells() const { return cells_; }

    /**
     * @brief 配置可能セル（行優先）
     */
    const std::vector<Cell>& empty_cells() const { return empty_cells_; }

    /**
     * @brief 固定ブロックの個数
     */
    size_t fixed_count() const { return fixed_count_; }

    const Inventory& inventory() const { return inventory_; }
    const std::vector<Laser>& lasers() const { return lasers_; }
    const std::vector<Point>& targets() const { return targets_; }

private:
    int width_;
    int height_;
    std::vector<CellSpec> cells_;
    Inventory inventory_;
    std::vector<Laser> lasers_;
    std::vector<Point> targets_;
    std::vector<Cell> empty_cells_;
    size_t fixed_count_ = 0;
};

/**
 * @brief 点を "(x, y)" 形式の文字列に変換
 */
std::string to_string(const Point& p);

/**
 * @brief セルを "[row, col]" 形式の文字列に変換
 */
std::string to_string(const Cell& cell);

} // namespace lazor

#endif // LAZOR_BOARD_HPP
