/**
 * @file explorer.hpp
 * @brief 複数シード並列探索
 */
#ifndef LAZOR_EXPLORER_HPP
#define LAZOR_EXPLORER_HPP

#include "lazor/solver.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace lazor {

/**
 * @brief 既定のシード列
 */
std::vector<uint64_t> default_seeds();

/**
 * @brief 複数シード並列探索
 *
 * シードごとに独立した Solver を並列に走らせる。ワーカー間で共有するのは
 * 不変の Board と停止フラグのみ。最初に完全解を見つけたワーカーが
 * 停止フラグを立て、他のワーカーは次の時間チェックで探索を打ち切る。
 *
 * 完全解がなければ (命中数の降順, 経過時間の昇順) で最良の部分解を返す。
 */
class Explorer {
public:
    Explorer();
    explicit Explorer(SearchOptions options);

    /**
     * @brief 並列探索を実行
     * @param board 解く盤面（探索中は変更しないこと）
     * @return 勝者の解（mode = MultiSeed）
     */
    Solution solve(const Board& board);

    /**
     * @brief シード列を設定（空なら default_seeds()）
     */
    void set_seeds(std::vector<uint64_t> seeds) { seeds_ = std::move(seeds); }

    /**
     * @brief 並列ワーカー数を設定（0 なら min(シード数, ハードウェアスレッド数)）
     */
    void set_workers(size_t workers) { workers_ = workers; }

    void set_time_limit(double seconds) { options_.time_limit = seconds; }
    void set_collision_model(CollisionModel model) { options_.collision = model; }
    void set_verbose(bool enabled) { options_.verbose = enabled; }

    const std::vector<uint64_t>& seeds() const { return seeds_; }

    /**
     * @brief 各シードの結果（実行されなかったシードは nullopt）
     */
    const std::vector<std::optional<Solution>>& worker_results() const { return results_; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { cancel_ = true; }

    bool is_stopped() const { return cancel_; }

private:
    /**
     * @brief ワーカー: シードを順に取り出して探索
     */
    void worker_loop(const Board& board, double time_limit);

    double elapsed() const;

    SearchOptions options_;
    std::vector<uint64_t> seeds_;
    size_t workers_ = 0;

    std::atomic<bool> cancel_{false};
    std::atomic<int> winner_{-1};
    std::atomic<size_t> next_seed_{0};
    std::vector<std::optional<Solution>> results_;

    std::chrono::steady_clock::time_point start_;
};

/**
 * @brief 複数シードで並列に配置を探索
 */
Solution solve_parallel(const Board& board, double time_limit, const std::vector<uint64_t>& seeds,
                        CollisionModel model = CollisionModel::Wall);

} // namespace lazor

#endif // LAZOR_EXPLORER_HPP
