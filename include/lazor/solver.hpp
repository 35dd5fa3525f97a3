/**
 * @file solver.hpp
 * @brief 配置探索ソルバー（バックトラック、部分集合反復、時間制限）
 */
#ifndef LAZOR_SOLVER_HPP
#define LAZOR_SOLVER_HPP

#include "lazor/board.hpp"
#include "lazor/placement.hpp"
#include "lazor/tracer.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace lazor {

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 全ターゲットに命中する配置が見つかった
    UNSAT,    // この部分木には存在しない
    UNKNOWN   // 時間切れ・停止により打ち切り
};

/**
 * @brief 解を生成した探索モード
 */
enum class SearchMode {
    Single,     // 単一シード
    MultiSeed   // 複数シード並列
};

const char* mode_name(SearchMode mode);

/**
 * @brief 探索設定
 */
struct SearchOptions {
    double time_limit = 180.0;      // 秒（0 以下なら無制限）
    uint64_t seed = 0;              // 探索順序のタイブレーク
    size_t check_interval = 64;     // 時間・停止フラグを確認するノード間隔
    CollisionModel collision = CollisionModel::Wall;
    bool subset_search = true;      // 全在庫で解けなければ個数を減らして再探索
    int min_blocks = 0;             // 部分集合反復の下限個数
    bool verbose = false;
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t nodes = 0;           // 展開したノード数
    size_t traces = 0;          // 構成の評価回数
    size_t subsets_tried = 0;   // 試した種別ごとの個数の組
    size_t max_depth = 0;
    size_t best_hits = 0;       // これまでの最大命中数
    int solved_subset = -1;     // 解を見つけた部分集合の個数（未発見なら -1）
    bool timed_out = false;
    bool cancelled = false;
};

/**
 * @brief 探索結果の解（完全解または途中までの最良解）
 */
struct Solution {
    bool solved = false;
    std::vector<PlacedBlock> placement;   // 可動ブロックのみ
    std::vector<bool> target_hits;        // Board::targets() と同順
    size_t hit_count = 0;
    double elapsed_seconds = 0.0;
    uint64_t seed = 0;
    CollisionModel collision = CollisionModel::Wall;
    SearchMode mode = SearchMode::Single;
    SolverStats stats;
};

/**
 * @brief 解の命中情報を再追跡して検証
 * @return 記録された命中フラグと再追跡結果が一致し、solved が全命中と一致すれば true
 */
bool verify(const Board& board, const Solution& solution);

/**
 * @brief 配置探索ソルバー
 *
 * 空きセルを重要度（ブロックなしで追跡した光線の通過数）の降順に並べ、
 * セルごとに「どの種別を置くか／空けるか」を分岐する。同種ブロックは
 * 区別しないため、同じ配置を重複して列挙しない。
 *
 * 以下の順で探索する：
 * - 全在庫を使う配置
 * - 個数を1つずつ減らした種別ごとの個数の組（部分集合反復）
 *
 * 各ノードで現在の構成を評価し、全ターゲットに命中すれば即座に採用する。
 * 命中数が最大の構成を最良解として記録し、時間切れ時に返す。
 */
class Solver {
public:
    Solver();
    explicit Solver(SearchOptions options);

    /**
     * @brief 配置を探索
     * @param board 解く盤面
     * @return 完全解（solved = true）または最良の部分解
     */
    Solution solve(const Board& board);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    const SearchOptions& options() const { return options_; }

    void set_time_limit(double seconds) { options_.time_limit = seconds; }
    void set_seed(uint64_t seed) { options_.seed = seed; }
    void set_check_interval(size_t interval) { options_.check_interval = interval > 0 ? interval : 1; }
    void set_collision_model(CollisionModel model) { options_.collision = model; }
    void set_subset_search(bool enabled) { options_.subset_search = enabled; }
    void set_min_blocks(int count) { options_.min_blocks = count; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { options_.verbose = enabled; }

    /**
     * @brief 外部の停止フラグを設定（並列探索で共有）
     */
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_flag_ = flag; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

private:
    using Clock = std::chrono::steady_clock;

    // ===== 探索 =====

    /**
     * @brief 1つの個数の組（quota）で探索
     */
    SearchResult search_subset(const std::array<int, BLOCK_TYPE_COUNT>& quota);

    /**
     * @brief 再帰探索
     * @param pos order_ 上の次に決めるスロット位置
     * @param depth 探索深さ
     * @param hits 現在の構成の命中数（-1 なら未評価）
     */
    SearchResult run_search(size_t pos, size_t depth, int hits);

    /**
     * @brief 現在の構成を評価し、最良解を更新
     * @return 命中数
     */
    int evaluate_current();

    /**
     * @brief 時間切れ・停止を確認（check_interval ノードごと）
     * @return 打ち切るなら true
     */
    bool check_limits();

    // ===== 順序付け =====

    /**
     * @brief スロットを重要度の降順に並べる
     */
    void order_slots();

    /**
     * @brief スロットで試すブロック種別の順序
     */
    std::vector<BlockType> type_order(size_t slot, size_t unhit) const;

    /**
     * @brief 個数 k の種別ごとの個数の組を列挙（Reflect の多い順）
     */
    std::vector<std::array<int, BLOCK_TYPE_COUNT>> subsets_of_size(int k) const;

    /**
     * @brief 結果を組み立てる
     */
    Solution build_solution() const;

    double elapsed() const;

    // ===== メンバ変数 =====

    SearchOptions options_;
    std::atomic<bool> stopped_{false};
    const std::atomic<bool>* cancel_flag_ = nullptr;

    // 探索中の状態（solve() の間のみ有効）
    const Board* board_ = nullptr;
    std::unique_ptr<Placement> placement_;
    std::unique_ptr<RayTracer> tracer_;
    std::vector<size_t> order_;               // スロットの探索順
    std::array<int, BLOCK_TYPE_COUNT> quota_{};
    int quota_total_ = 0;
    std::vector<bool> hit_buffer_;
    bool interrupted_ = false;
    size_t next_check_ = 0;

    // 最良解（命中数最大、同数なら先に見つけた方）
    int best_hits_ = -1;
    std::vector<PlacedBlock> best_placement_;
    std::vector<bool> best_target_hits_;

    Clock::time_point start_;
    SolverStats stats_;
};

/**
 * @brief 単一シードで配置を探索
 */
Solution solve(const Board& board, double time_limit, uint64_t seed,
               CollisionModel model = CollisionModel::Wall);

} // namespace lazor

#endif // LAZOR_SOLVER_HPP
