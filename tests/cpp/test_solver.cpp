#include <catch2/catch_test_macros.hpp>
#include "lazor/solver.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>

using namespace lazor;
using lazor::testing::make_board;

namespace {

// A を (1,1) に置いたときだけ (0,3) と (3,0) に届く。B は使わない。
Board reflect_only_board(Inventory inventory) {
    return make_board({"ox", "xo"}, inventory, {{{0, 1}, 1, 1}}, {{0, 3}, {3, 0}});
}

// 4本のレーザーがそれぞれ1つずつターゲットを受け持つ
std::vector<Laser> four_lasers() {
    return {{{0, 0}, 1, 1}, {{0, 1}, 1, 1}, {{4, 0}, -1, 1}, {{2, 0}, 1, 1}};
}

std::vector<Point> four_targets() {
    return {{4, 4}, {2, 3}, {0, 4}, {4, 2}};
}

}  // namespace

// ============================================================================
// 基本
// ============================================================================

TEST_CASE("Solver finds the unique placement", "[solver]") {
    auto board = reflect_only_board(Inventory(1, 0, 0));
    Solver solver;
    auto sol = solver.solve(board);

    REQUIRE(sol.solved);
    REQUIRE(sol.hit_count == 2);
    REQUIRE(sol.placement == std::vector<PlacedBlock>{{{1, 1}, BlockType::Reflect}});
    REQUIRE(sol.target_hits == std::vector<bool>{true, true});
    REQUIRE(sol.mode == SearchMode::Single);
    REQUIRE(sol.collision == CollisionModel::Wall);
    REQUIRE(verify(board, sol));
}

TEST_CASE("Solver accepts a board solved without blocks", "[solver]") {
    SECTION("no targets") {
        auto board = make_board({"oo"}, Inventory(1, 0, 0), {{{0, 0}, 1, 1}}, {});
        auto sol = solve(board, 1.0, 0);
        REQUIRE(sol.solved);
        REQUIRE(sol.placement.empty());
    }

    SECTION("targets already on the free path") {
        auto board = make_board({"oo", "oo"}, Inventory(0, 1, 0), {{{0, 0}, 1, 1}}, {{4, 4}});
        auto sol = solve(board, 1.0, 0);
        REQUIRE(sol.solved);
        REQUIRE(verify(board, sol));
    }
}

TEST_CASE("Subset iteration solves boards with surplus inventory", "[solver]") {
    // 全在庫（A と B）を置くと必ず失敗する
    auto board = reflect_only_board(Inventory(1, 1, 0));
    Solver solver;
    auto sol = solver.solve(board);

    REQUIRE(sol.solved);
    REQUIRE(sol.placement.size() < static_cast<size_t>(board.inventory().total()));
    REQUIRE(sol.placement == std::vector<PlacedBlock>{{{1, 1}, BlockType::Reflect}});
    REQUIRE(verify(board, sol));
    REQUIRE(sol.stats.solved_subset >= 1);
}

TEST_CASE("Solver returns the earliest best partial when unsolvable", "[solver]") {
    // B しかなく (0,3) には届かない。(2,3) は空配置で命中する
    auto board = make_board({"ox", "xo"}, Inventory(0, 1, 0), {{{0, 1}, 1, 1}},
                            {{2, 3}, {0, 3}});
    Solver solver;
    auto sol = solver.solve(board);

    REQUIRE_FALSE(sol.solved);
    REQUIRE(sol.hit_count == 1);
    REQUIRE(sol.target_hits == std::vector<bool>{true, false});
    // 同数なら先に見つけた空配置
    REQUIRE(sol.placement.empty());
    REQUIRE(sol.stats.best_hits == 1);
    REQUIRE_FALSE(sol.stats.timed_out);
    REQUIRE(verify(board, sol));
}

// ============================================================================
// 複数レーザー
// ============================================================================

TEST_CASE("All lasers are needed to cover the targets", "[solver]") {
    SECTION("four lasers cover every target") {
        auto board = make_board({"oo", "oo"}, Inventory(), four_lasers(), four_targets());
        auto sol = solve(board, 1.0, 0);
        REQUIRE(sol.solved);
        REQUIRE(sol.hit_count == 4);
    }

    SECTION("dropping any laser leaves a target unhit") {
        for (size_t drop = 0; drop < 4; ++drop) {
            auto lasers = four_lasers();
            lasers.erase(lasers.begin() + static_cast<long>(drop));
            auto board = make_board({"oo", "oo"}, Inventory(), lasers, four_targets());
            auto sol = solve(board, 1.0, 0);
            REQUIRE_FALSE(sol.solved);
            REQUIRE(sol.hit_count == 3);
            REQUIRE_FALSE(sol.target_hits[drop]);
        }
    }

    SECTION("fixed blocks filling every open slot") {
        // 3つの固定ブロックと1つの配置ブロックで盤面が埋まる
        auto board = make_board({"Bo", "BB"}, Inventory(1, 0, 0), four_lasers(),
                                four_targets());
        auto sol = solve(board, 1.0, 0);
        REQUIRE_FALSE(sol.solved);
        REQUIRE(verify(board, sol));
    }
}

// ============================================================================
// 決定性
// ============================================================================

TEST_CASE("Solver is deterministic for a fixed seed", "[solver]") {
    auto board = make_board({"ooo", "ooo", "ooo"}, Inventory(2, 1, 1),
                            {{{0, 3}, 1, -1}, {{6, 5}, -1, -1}},
                            {{3, 0}, {0, 5}, {6, 1}, {4, 6}});

    for (uint64_t seed : {0ULL, 1ULL, 17ULL}) {
        SearchOptions options;
        options.seed = seed;
        options.time_limit = 5.0;

        Solver a(options);
        Solver b(options);
        auto sa = a.solve(board);
        auto sb = b.solve(board);

        REQUIRE(sa.solved == sb.solved);
        REQUIRE(sa.placement == sb.placement);
        REQUIRE(sa.target_hits == sb.target_hits);
        REQUIRE(sa.stats.nodes == sb.stats.nodes);
        REQUIRE(sa.stats.traces == sb.stats.traces);
        REQUIRE(sa.seed == seed);
        REQUIRE(verify(board, sa));
    }
}

TEST_CASE("Different seeds all solve the board", "[solver]") {
    auto board = reflect_only_board(Inventory(1, 1, 0));
    for (uint64_t seed : {0ULL, 2ULL, 5ULL, 23ULL, 29ULL}) {
        auto sol = solve(board, 5.0, seed);
        REQUIRE(sol.solved);
        REQUIRE(verify(board, sol));
    }
}

TEST_CASE("Center collision model finds the same solution", "[solver]") {
    auto board = reflect_only_board(Inventory(1, 0, 0));
    auto sol = solve(board, 1.0, 0, CollisionModel::Center);
    REQUIRE(sol.solved);
    REQUIRE(sol.collision == CollisionModel::Center);
    REQUIRE(sol.placement == std::vector<PlacedBlock>{{{1, 1}, BlockType::Reflect}});
}

// ============================================================================
// 時間制限と停止
// ============================================================================

TEST_CASE("Solver respects the time limit", "[solver]") {
    // 届かないターゲットと大量の配置
    std::vector<std::string> rows(8, "oooooooo");
    auto board = make_board(rows, Inventory(4, 4, 4), {{{0, 1}, 1, 1}},
                            {{16, 16}, {0, 16}, {16, 0}, {8, 0}, {0, 8}, {5, 5}});

    SearchOptions options;
    options.time_limit = 0.2;
    Solver solver(options);

    auto start = std::chrono::steady_clock::now();
    auto sol = solver.solve(board);
    double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!sol.solved) {
        REQUIRE(sol.stats.timed_out);
    }
    REQUIRE(wall < options.time_limit + 1.0);
    REQUIRE(sol.elapsed_seconds < options.time_limit + 1.0);
    REQUIRE(verify(board, sol));
}

TEST_CASE("Solver honors stop requests", "[solver]") {
    std::vector<std::string> rows(6, "oooooo");
    auto board = make_board(rows, Inventory(0, 6, 0), {}, {{0, 0}});

    SECTION("stop before solving") {
        Solver solver;
        solver.stop();
        auto sol = solver.solve(board);
        REQUIRE(sol.stats.cancelled);
        REQUIRE_FALSE(sol.solved);
        REQUIRE(sol.placement.empty());
        REQUIRE(sol.target_hits == std::vector<bool>{false});

        solver.reset_stop();
        REQUIRE_FALSE(solver.is_stopped());
    }

    SECTION("shared cancel flag") {
        std::atomic<bool> cancel{true};
        Solver solver;
        solver.set_cancel_flag(&cancel);
        auto sol = solver.solve(board);
        REQUIRE(sol.stats.cancelled);
        REQUIRE_FALSE(sol.solved);
    }
}

TEST_CASE("Solver without subset iteration", "[solver]") {
    // 全在庫の組だけを探索する
    auto board = make_board({"oo"}, Inventory(0, 2, 0), {{{0, 0}, 1, 1}}, {{4, 0}});
    Solver solver;
    solver.set_subset_search(false);
    auto sol = solver.solve(board);
    REQUIRE(sol.stats.subsets_tried == 1);
    REQUIRE(verify(board, sol));
}
