#include "lazor/explorer.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

namespace lazor {

std::vector<uint64_t> default_seeds() {
    return {0, 1, 2, 3, 5, 7, 11, 13, 17, 19, 23, 29};
}

Explorer::Explorer() = default;

Explorer::Explorer(SearchOptions options)
    : options_(options) {}

Solution Explorer::solve(const Board& board) {
    if (seeds_.empty()) {
        seeds_ = default_seeds();
    }
    results_.assign(seeds_.size(), std::nullopt);
    cancel_ = false;
    winner_ = -1;
    next_seed_ = 0;
    start_ = std::chrono::steady_clock::now();

    size_t workers = workers_;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, seeds_.size());

    if (options_.verbose) {
        std::cerr << "% [verbose] explorer start: " << seeds_.size() << " seeds, "
                  << workers << " workers, time_limit=" << options_.time_limit << "s\n";
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(&Explorer::worker_loop, this, std::cref(board), options_.time_limit);
    }
    for (auto& t : threads) {
        t.join();
    }

    std::optional<Solution> best;
    int winner = winner_.load();
    if (winner >= 0 && results_[static_cast<size_t>(winner)]) {
        best = results_[static_cast<size_t>(winner)];
    } else {
        // (命中数の降順, 経過時間の昇順)
        for (const auto& r : results_) {
            if (!r) {
                continue;
            }
            if (!best || r->hit_count > best->hit_count ||
                (r->hit_count == best->hit_count && r->elapsed_seconds < best->elapsed_seconds)) {
                best = r;
            }
        }
    }

    if (!best) {
        // どのシードも実行されなかった: 空配置を評価
        Solution empty;
        Placement placement(board);
        empty.target_hits = evaluate(placement, options_.collision);
        empty.hit_count = static_cast<size_t>(
            std::count(empty.target_hits.begin(), empty.target_hits.end(), true));
        empty.solved = empty.hit_count == board.targets().size();
        empty.seed = seeds_.front();
        empty.collision = options_.collision;
        best = std::move(empty);
    }

    best->mode = SearchMode::MultiSeed;
    best->elapsed_seconds = elapsed();

    if (options_.verbose) {
        std::cerr << "% [verbose] explorer finished: " << (best->solved ? "solved" : "partial")
                  << " seed=" << best->seed << " hits=" << best->hit_count << "/"
                  << board.targets().size() << " elapsed=" << best->elapsed_seconds << "s\n";
    }
    return *best;
}

void Explorer::worker_loop(const Board& board, double time_limit) {
    while (!cancel_.load()) {
        size_t idx = next_seed_.fetch_add(1);
        if (idx >= seeds_.size()) {
            return;
        }

        SearchOptions options = options_;
        options.seed = seeds_[idx];
        // ワーカーの情報は個別に出す
        options.verbose = false;
        if (time_limit > 0.0) {
            double remaining = time_limit - elapsed();
            if (remaining <= 0.0) {
                return;
            }
            options.time_limit = remaining;
        }

        Solver solver(options);
        solver.set_cancel_flag(&cancel_);
        Solution sol = solver.solve(board);
        bool solved = sol.solved;

        if (options_.verbose) {
            std::ostringstream line;
            line << "% [verbose] seed=" << sol.seed << " " << (solved ? "solved" : "partial")
                 << " hits=" << sol.hit_count << "/" << board.targets().size()
                 << " nodes=" << sol.stats.nodes << " elapsed=" << sol.elapsed_seconds << "s\n";
            std::cerr << line.str();
        }

        results_[idx] = std::move(sol);

        if (solved) {
            int expected = -1;
            if (winner_.compare_exchange_strong(expected, static_cast<int>(idx))) {
                cancel_ = true;
            }
        }
    }
}

double Explorer::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

Solution solve_parallel(const Board& board, double time_limit, const std::vector<uint64_t>& seeds,
                        CollisionModel model) {
    SearchOptions options;
    options.time_limit = time_limit;
    options.collision = model;
    Explorer explorer(options);
    explorer.set_seeds(seeds);
    return explorer.solve(board);
}

} // namespace lazor
