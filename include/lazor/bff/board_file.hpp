/**
 * @file board_file.hpp
 * @brief .bff 盤面ファイルの中間表現
 */
#ifndef LAZOR_BFF_BOARD_FILE_HPP
#define LAZOR_BFF_BOARD_FILE_HPP

#include "lazor/board.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lazor {
namespace bff {

/**
 * @brief レーザー宣言（L x y vx vy）
 */
struct LaserDecl {
    long long x;
    long long y;
    long long dx;
    long long dy;
    int line = 0;
};

/**
 * @brief ターゲット宣言（P x y）
 */
struct TargetDecl {
    long long x;
    long long y;
    int line = 0;
};

/**
 * @brief .bff ファイルの内容
 *
 * GRID START / GRID STOP で囲まれたセル記号の行、在庫行（A 2, A: 2, A=2）、
 * レーザー行、ターゲット行を保持する。
 */
class BoardFile {
public:
    BoardFile() = default;

    /**
     * @brief グリッド行を追加
     * @param symbols セル記号（o, x, A, B, C）
     */
    void add_grid_row(std::vector<char> symbols) { grid_.push_back(std::move(symbols)); }

    /**
     * @brief 在庫を設定（同じ種別は後の宣言で上書き）
     */
    void set_inventory(BlockType type, int count) { inventory_[type] = count; }

    void add_laser(LaserDecl decl) { lasers_.push_back(decl); }
    void add_target(TargetDecl decl) { targets_.push_back(decl); }

    const std::vector<std::vector<char>>& grid() const { return grid_; }
    const Inventory& inventory() const { return inventory_; }
    const std::vector<LaserDecl>& lasers() const { return lasers_; }
    const std::vector<TargetDecl>& targets() const { return targets_; }

    /**
     * @brief 盤面モデルに変換
     * @throws std::invalid_argument 盤面の検証に失敗した場合
     */
    Board to_board() const;

private:
    std::vector<std::vector<char>> grid_;
    Inventory inventory_;
    std::vector<LaserDecl> lasers_;
    std::vector<TargetDecl> targets_;
};

/**
 * @brief セル記号が有効か（o, x, A, B, C）
 */
bool is_cell_symbol(char symbol);

/**
 * @brief .bff ファイルをパース
 * @param filename ファイル名
 * @return パースされた内容
 * @throws std::runtime_error ファイルが開けない、またはパースエラー時
 */
std::unique_ptr<BoardFile> parse_file(const std::string& filename);

/**
 * @brief .bff 文字列をパース
 * @param input 入力文字列
 * @return パースされた内容
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<BoardFile> parse_string(const std::string& input);

/**
 * @brief .bff ファイルを読み込んで盤面を構築
 * @throws std::runtime_error パースエラー時
 * @throws std::invalid_argument 盤面の検証に失敗した場合
 */
Board load_board(const std::string& filename);

} // namespace bff
} // namespace lazor

#endif // LAZOR_BFF_BOARD_FILE_HPP
