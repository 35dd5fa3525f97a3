/**
 * @file tracer.hpp
 * @brief 光線追跡（反射・吸収・分岐、周回検出付き）
 */
#ifndef LAZOR_TRACER_HPP
#define LAZOR_TRACER_HPP

#include "lazor/board.hpp"
#include "lazor/placement.hpp"
#include <cstdint>
#include <vector>

namespace lazor {

/**
 * @brief 衝突判定の方式
 *
 * 両方式は同じ追跡結果を与える（テストで相互検証する）。
 */
enum class CollisionModel {
    Wall,   // 移動が占有セルの辺を越える瞬間に判定
    Center  // 現在位置とセル中心座標の偶奇関係から判定
};

const char* collision_name(CollisionModel model);

/**
 * @brief 光線の状態（位置と方向）
 */
struct RayState {
    Point pos;
    int dx;
    int dy;
};

/**
 * @brief 追跡統計
 */
struct TraceStats {
    size_t rays_spawned = 0;     // 1 + 分岐回数
    size_t rays_absorbed = 0;    // Opaque で終端した光線
    size_t rays_cycled = 0;      // 状態の再訪で終端した光線
    size_t steps = 0;            // 処理した (位置, 方向) 状態数
    size_t peak_active = 0;      // 同時に存在した光線の最大数
};

/**
 * @brief 光線が通過した格子点の集合
 *
 * points() は初回訪問順、contains() は格子ビットマップで O(1)。
 */
class Trajectory {
public:
    Trajectory() = default;
    Trajectory(int lattice_width, int lattice_height);

    /**
     * @brief 点を追加
     * @return 新規の点なら true
     */
    bool add(const Point& p);

    /**
     * @brief 点が含まれるか（格子外は false）
     */
    bool contains(const Point& p) const;

    const std::vector<Point>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    TraceStats& stats() { return stats_; }
    const TraceStats& stats() const { return stats_; }

    /**
     * @brief 別の軌跡を和集合として取り込む
     */
    void merge(const Trajectory& other);

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> mask_;
    std::vector<Point> points_;
    TraceStats stats_;
};

/**
 * @brief 光線追跡器
 *
 * 構成（Placement = 固定ブロック + 配置ブロック）とレーザーから
 * 全分岐光線の通過点を求める純関数。作業バッファを再利用するため、
 * 探索中は1つのインスタンスを使い回す（スレッド間では共有しない）。
 *
 * 光線の集合は明示的なスタックで管理し、(位置, 方向) の訪問集合を
 * レーザー単位で持つ。状態が再訪された光線はそこで終端する。
 */
class RayTracer {
public:
    explicit RayTracer(const Board& board, CollisionModel model = CollisionModel::Wall);

    CollisionModel model() const { return model_; }

    /**
     * @brief 1本のレーザーを追跡
     */
    Trajectory trace(const Placement& config, const Laser& laser);

    /**
     * @brief 全レーザーを追跡し、和集合を返す
     */
    Trajectory trace_all(const Placement& config);

    /**
     * @brief ターゲット命中判定（軌跡リストを作らない高速版）
     * @param hits 出力: ターゲットごとの命中フラグ
     * @return 命中したターゲット数
     */
    size_t count_hits(const Placement& config, std::vector<bool>& hits);

    /**
     * @brief 最後の count_hits() で訪問した点か
     */
    bool visited(const Point& p) const;

private:
    /**
     * @brief 1本のレーザーを追跡して point_epoch_ に印を付ける
     * @param out nullptr でなければ訪問点を追記
     */
    void run(const Placement& config, const Laser& laser, Trajectory* out, TraceStats& stats);

    void next_point_epoch();

    /**
     * @brief 次の移動で進入するセルと反転軸を求める
     */
    struct Crossing {
        enum class Kind { None, Border, Block } kind = Kind::None;
        Cell cell;
        bool flip_x = false;
        bool flip_y = false;
    };
    Crossing wall_crossing(const RayState& ray) const;
    Crossing center_crossing(const RayState& ray) const;

    const Board* board_;
    CollisionModel model_;

    // 世代番号によるバッファ再利用（クリア不要）
    std::vector<uint32_t> state_epoch_;
    std::vector<uint8_t> state_bits_;
    uint32_t current_state_epoch_ = 0;
    std::vector<uint32_t> point_epoch_;
    uint32_t current_point_epoch_ = 0;

    std::vector<RayState> active_;
};

/**
 * @brief 1本のレーザーを追跡（RayTracer の簡易版）
 */
Trajectory trace(const Placement& config, const Laser& laser,
                 CollisionModel model = CollisionModel::Wall);

/**
 * @brief 構成に対するターゲットごとの命中フラグ
 */
std::vector<bool> evaluate(const Placement& config, CollisionModel model = CollisionModel::Wall);

} // namespace lazor

#endif // LAZOR_TRACER_HPP
