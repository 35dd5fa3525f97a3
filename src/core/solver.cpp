#include "lazor/solver.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>

namespace lazor {

namespace {
// MurmurHash3 64-bit finalizer
inline uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
}

constexpr uint64_t GOLDEN = 0x9e3779b97f4a7c15ULL;
}  // namespace

const char* mode_name(SearchMode mode) {
    switch (mode) {
    case SearchMode::Single:    return "single";
    case SearchMode::MultiSeed: return "multi-seed";
    }
    return "unknown";
}

bool verify(const Board& board, const Solution& solution) {
    Placement placement(board);
    for (const auto& block : solution.placement) {
        if (!placement.assign(block.cell, block.type)) {
            return false;
        }
    }

    auto hits = evaluate(placement, solution.collision);
    if (hits != solution.target_hits) {
        return false;
    }
    auto count = static_cast<size_t>(std::count(hits.begin(), hits.end(), true));
    if (count != solution.hit_count) {
        return false;
    }
    return solution.solved == (count == hits.size());
}

Solver::Solver() = default;

Solver::Solver(SearchOptions options)
    : options_(options) {
    if (options_.check_interval == 0) {
        options_.check_interval = 1;
    }
}

Solution Solver::solve(const Board& board) {
    board_ = &board;
    placement_ = std::make_unique<Placement>(board);
    tracer_ = std::make_unique<RayTracer>(board, options_.collision);
    stats_ = SolverStats{};
    interrupted_ = false;
    next_check_ = 0;
    best_hits_ = -1;
    best_placement_.clear();
    best_target_hits_.clear();
    start_ = Clock::now();

    const auto& inv = board.inventory();
    if (options_.verbose) {
        std::cerr << "% [verbose] solve start: " << board.width() << "x" << board.height()
                  << " board, " << board.empty_cells().size() << " empty cells, inventory A="
                  << inv[BlockType::Reflect] << " B=" << inv[BlockType::Opaque]
                  << " C=" << inv[BlockType::Refract] << ", " << board.lasers().size()
                  << " lasers, " << board.targets().size() << " targets, seed="
                  << options_.seed << ", collision=" << collision_name(options_.collision)
                  << "\n";
    }

    order_slots();

    // 全在庫を使う配置
    std::array<int, BLOCK_TYPE_COUNT> full = {
        inv[BlockType::Reflect], inv[BlockType::Opaque], inv[BlockType::Refract]
    };
    auto res = search_subset(full);

    // 部分集合反復: 個数を減らして再探索
    if (res == SearchResult::UNSAT && options_.subset_search) {
        int lower = std::max(0, options_.min_blocks);
        for (int k = inv.total() - 1; k >= lower && res == SearchResult::UNSAT; --k) {
            for (const auto& quota : subsets_of_size(k)) {
                res = search_subset(quota);
                if (res != SearchResult::UNSAT) {
                    break;
                }
            }
        }
    }

    // 一度も評価できずに打ち切られた場合は空配置を評価
    if (best_hits_ < 0) {
        placement_->clear();
        evaluate_current();
    }

    if (options_.verbose) {
        std::cerr << "% [verbose] solve finished: "
                  << (res == SearchResult::SAT ? "solved"
                      : res == SearchResult::UNKNOWN ? "interrupted" : "exhausted")
                  << " nodes=" << stats_.nodes << " traces=" << stats_.traces
                  << " best=" << best_hits_ << "/" << board.targets().size()
                  << " elapsed=" << elapsed() << "s\n";
    }

    return build_solution();
}

SearchResult Solver::search_subset(const std::array<int, BLOCK_TYPE_COUNT>& quota) {
    quota_ = quota;
    quota_total_ = quota[0] + quota[1] + quota[2];
    stats_.subsets_tried++;

    if (options_.verbose) {
        std::cerr << "% [verbose] subset k=" << quota_total_ << " (A=" << quota[0]
                  << " B=" << quota[1] << " C=" << quota[2] << ") nodes=" << stats_.nodes
                  << "\n";
    }

    placement_->clear();
    auto res = run_search(0, 0, -1);
    placement_->clear();

    if (res == SearchResult::SAT) {
        stats_.solved_subset = quota_total_;
    }
    return res;
}

SearchResult Solver::run_search(size_t pos, size_t depth, int hits) {
    // タイムアウト・停止チェック
    if (check_limits()) {
        return SearchResult::UNKNOWN;
    }

    // 統計更新
    stats_.nodes++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (hits < 0) {
        hits = evaluate_current();
    }
    const size_t num_targets = board_->targets().size();
    if (static_cast<size_t>(hits) == num_targets) {
        return SearchResult::SAT;
    }

    // 置くべきブロックが残っていない、または残りの空きセルが足りない
    int to_place = quota_total_ - placement_->placed_count();
    if (to_place <= 0) {
        return SearchResult::UNSAT;
    }
    size_t slots_left = order_.size() - pos;
    if (slots_left < static_cast<size_t>(to_place)) {
        return SearchResult::UNSAT;
    }

    size_t slot = order_[pos];
    for (auto type : type_order(slot, num_targets - static_cast<size_t>(hits))) {
        if (placement_->used(type) >= quota_[block_index(type)]) {
            continue;
        }
        size_t save_point = placement_->save_point();
        if (!placement_->assign(slot, type)) {
            continue;
        }

        auto res = run_search(pos + 1, depth + 1, -1);
        placement_->rewind_to(save_point);

        if (res != SearchResult::UNSAT) {
            return res;
        }
    }

    // このスロットを空けたまま次へ（構成は変わらないので評価を引き継ぐ）
    if (slots_left > static_cast<size_t>(to_place)) {
        auto res = run_search(pos + 1, depth + 1, hits);
        if (res != SearchResult::UNSAT) {
            return res;
        }
    }

    return SearchResult::UNSAT;
}

int Solver::evaluate_current() {
    stats_.traces++;
    auto hits = static_cast<int>(tracer_->count_hits(*placement_, hit_buffer_));

    if (hits > best_hits_) {
        best_hits_ = hits;
        best_placement_ = placement_->entries();
        best_target_hits_ = hit_buffer_;
        stats_.best_hits = static_cast<size_t>(hits);

        if (options_.verbose) {
            std::cerr << "% [verbose] best hits=" << hits << "/" << board_->targets().size()
                      << " placed=" << placement_->placed_count()
                      << " nodes=" << stats_.nodes << "\n";
        }
    }
    return hits;
}

bool Solver::check_limits() {
    if (interrupted_) {
        return true;
    }
    if (stats_.nodes < next_check_) {
        return false;
    }
    next_check_ = stats_.nodes + options_.check_interval;

    if (stopped_ || (cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed))) {
        stats_.cancelled = true;
        interrupted_ = true;
        return true;
    }
    if (options_.time_limit > 0.0 && elapsed() >= options_.time_limit) {
        stats_.timed_out = true;
        interrupted_ = true;
        if (options_.verbose) {
            std::cerr << "% [verbose] search stopped (timeout)\n";
        }
        return true;
    }
    return false;
}

void Solver::order_slots() {
    const auto& board = *board_;
    Placement fixed_only(board);
    RayTracer tracer(board, options_.collision);

    // 重要度: ブロックなしの追跡でセルに触れたレーザー数と通過点数
    std::vector<long> score(fixed_only.slot_count(), 0);
    for (const auto& laser : board.lasers()) {
        auto traj = tracer.trace(fixed_only, laser);
        for (size_t s = 0; s < score.size(); ++s) {
            Point c = fixed_only.slot_cell(s).center();
            long passes = 0;
            for (int dy = -1; dy <= 1; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (traj.contains({c.x + dx, c.y + dy})) {
                        passes++;
                    }
                }
            }
            if (passes > 0) {
                score[s] += 4 + passes;
            }
        }
    }
    // ターゲットに接するセル
    for (const auto& t : board.targets()) {
        for (size_t s = 0; s < score.size(); ++s) {
            Point c = fixed_only.slot_cell(s).center();
            if (std::abs(t.x - c.x) <= 1 && std::abs(t.y - c.y) <= 1) {
                score[s] += 2;
            }
        }
    }

    order_.resize(score.size());
    std::iota(order_.begin(), order_.end(), 0);

    // 同点はシードのハッシュ順
    uint64_t seed = options_.seed;
    std::vector<uint64_t> tie(score.size());
    for (size_t s = 0; s < tie.size(); ++s) {
        tie[s] = fmix64(seed ^ (static_cast<uint64_t>(s + 1) * GOLDEN));
    }
    std::sort(order_.begin(), order_.end(), [&score, &tie](size_t a, size_t b) {
        if (score[a] != score[b]) return score[a] > score[b];
        if (tie[a] != tie[b]) return tie[a] < tie[b];
        return a < b;
    });

    if (options_.verbose) {
        std::cerr << "% [verbose] slot order:";
        for (size_t s : order_) {
            std::cerr << " " << to_string(fixed_only.slot_cell(s)) << "=" << score[s];
        }
        std::cerr << "\n";
    }
}

std::vector<BlockType> Solver::type_order(size_t slot, size_t unhit) const {
    // 未命中が多い間は分岐で到達範囲を広げる Refract を優先
    std::array<uint64_t, BLOCK_TYPE_COUNT> priority{};
    if (unhit > board_->lasers().size()) {
        priority[block_index(BlockType::Refract)] = 0;
        priority[block_index(BlockType::Reflect)] = 1;
        priority[block_index(BlockType::Opaque)] = 2;
    } else {
        priority[block_index(BlockType::Reflect)] = 0;
        priority[block_index(BlockType::Refract)] = 1;
        priority[block_index(BlockType::Opaque)] = 2;
    }

    // シードで隣接順位を入れ替える
    std::array<uint64_t, BLOCK_TYPE_COUNT> key{};
    for (auto type : ALL_BLOCK_TYPES) {
        size_t i = block_index(type);
        key[i] = priority[i] * 4;
        if (options_.seed != 0) {
            uint64_t h = fmix64(options_.seed ^ (static_cast<uint64_t>(slot + 1) * GOLDEN) ^
                                static_cast<uint64_t>(i + 1));
            key[i] += h % 6;
        }
    }

    std::vector<BlockType> types(ALL_BLOCK_TYPES.begin(), ALL_BLOCK_TYPES.end());
    std::sort(types.begin(), types.end(), [&key](BlockType a, BlockType b) {
        auto ka = key[block_index(a)];
        auto kb = key[block_index(b)];
        if (ka != kb) return ka < kb;
        return block_index(a) < block_index(b);
    });
    return types;
}

std::vector<std::array<int, BLOCK_TYPE_COUNT>> Solver::subsets_of_size(int k) const {
    const auto& inv = board_->inventory();
    std::vector<std::array<int, BLOCK_TYPE_COUNT>> result;
    for (int a = std::min(inv[BlockType::Reflect], k); a >= 0; --a) {
        for (int b = std::min(inv[BlockType::Opaque], k - a); b >= 0; --b) {
            int c = k - a - b;
            if (c > inv[BlockType::Refract]) {
                continue;
            }
            result.push_back({a, b, c});
        }
    }
    return result;
}

Solution Solver::build_solution() const {
    Solution sol;
    sol.hit_count = best_hits_ < 0 ? 0 : static_cast<size_t>(best_hits_);
    sol.solved = best_hits_ >= 0 && sol.hit_count == board_->targets().size();
    sol.placement = best_placement_;
    sol.target_hits = best_target_hits_;
    sol.elapsed_seconds = elapsed();
    sol.seed = options_.seed;
    sol.collision = options_.collision;
    sol.mode = SearchMode::Single;
    sol.stats = stats_;
    return sol;
}

double Solver::elapsed() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

Solution solve(const Board& board, double time_limit, uint64_t seed, CollisionModel model) {
    SearchOptions options;
    options.time_limit = time_limit;
    options.seed = seed;
    options.collision = model;
    Solver solver(options);
    return solver.solve(board);
}

} // namespace lazor
