#include <catch2/catch_test_macros.hpp>
#include "lazor/tracer.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <random>

using namespace lazor;
using lazor::testing::make_board;

namespace {
std::vector<Point> sorted_points(const Trajectory& t) {
    auto points = t.points();
    std::sort(points.begin(), points.end());
    return points;
}
}  // namespace

// ============================================================================
// 単純な伝播
// ============================================================================

TEST_CASE("Ray bounces off the outer border and cycles", "[tracer]") {
    auto board = make_board({"oo", "oo"}, Inventory(), {}, {});
    Placement config(board);
    Laser laser{{0, 0}, 1, 1};

    for (auto model : {CollisionModel::Wall, CollisionModel::Center}) {
        auto traj = trace(config, laser, model);
        std::vector<Point> expected = {{0, 0}, {1, 1}, {2, 2}, {3, 3}, {4, 4}};
        REQUIRE(traj.points() == expected);
        REQUIRE(traj.stats().rays_spawned == 1);
        REQUIRE(traj.stats().rays_cycled == 1);
        REQUIRE(traj.stats().rays_absorbed == 0);
    }
}

TEST_CASE("Ray from an edge midpoint travels a diamond", "[tracer]") {
    auto board = make_board({"oo", "oo"}, Inventory(), {}, {});
    Placement config(board);

    auto traj = trace(config, {{0, 1}, 1, 1});
    std::vector<Point> expected = {{0, 1}, {1, 2}, {2, 3}, {3, 4},
                                   {4, 3}, {3, 2}, {2, 1}, {1, 0}};
    REQUIRE(traj.points() == expected);
}

// ============================================================================
// ブロックとの相互作用
// ============================================================================

TEST_CASE("Reflect block at a corner flips both components", "[tracer]") {
    auto board = make_board({"oo", "oA"}, Inventory(), {}, {});
    Placement config(board);

    auto traj = trace(config, {{0, 0}, 1, 1});
    std::vector<Point> expected = {{0, 0}, {1, 1}, {2, 2}};
    REQUIRE(traj.points() == expected);
    REQUIRE_FALSE(traj.contains({3, 3}));
    REQUIRE_FALSE(traj.contains({4, 4}));
}

TEST_CASE("Reflect block on a side flips one component", "[tracer]") {
    auto board = make_board({"oo", "oo"}, Inventory(1, 0, 0), {}, {});
    auto config = make_placement(board, {{{1, 1}, BlockType::Reflect}});

    for (auto model : {CollisionModel::Wall, CollisionModel::Center}) {
        auto traj = trace(config, {{0, 1}, 1, 1}, model);
        std::vector<Point> expected = {{0, 1}, {1, 2}, {2, 3}, {1, 4}, {0, 3},
                                       {2, 1}, {3, 0}, {4, 1}, {3, 2}, {1, 0}};
        REQUIRE(traj.points() == expected);
        REQUIRE(traj.contains({0, 3}));
        REQUIRE_FALSE(traj.contains({3, 4}));
    }
}

TEST_CASE("Opaque block absorbs the ray", "[tracer]") {
    auto board = make_board({"oo", "oB"}, Inventory(), {}, {});
    Placement config(board);

    auto traj = trace(config, {{0, 0}, 1, 1});
    std::vector<Point> expected = {{0, 0}, {1, 1}, {2, 2}};
    REQUIRE(traj.points() == expected);
    REQUIRE(traj.stats().rays_absorbed == 1);
    REQUIRE(traj.stats().rays_cycled == 0);

    SECTION("nothing beyond the absorbing block") {
        REQUIRE_FALSE(traj.contains({3, 3}));
        REQUIRE_FALSE(traj.contains({4, 4}));
    }
}

TEST_CASE("Opaque block at the laser origin absorbs immediately", "[tracer]") {
    auto board = make_board({"Bo", "oo"}, Inventory(), {}, {});
    Placement config(board);

    auto traj = trace(config, {{0, 0}, 1, 1});
    REQUIRE(traj.points() == std::vector<Point>{{0, 0}});
    REQUIRE(traj.stats().rays_absorbed == 1);
}

TEST_CASE("Refract block forks the ray", "[tracer]") {
    auto board = make_board({"oo", "oC"}, Inventory(), {}, {});
    Placement config(board);

    for (auto model : {CollisionModel::Wall, CollisionModel::Center}) {
        auto traj = trace(config, {{0, 0}, 1, 1}, model);

        // 直進した光線は (4,4) に届く
        REQUIRE(traj.contains({4, 4}));
        REQUIRE(traj.size() == 5);

        // Refract を2回横切る: 1 + 2 本
        REQUIRE(traj.stats().rays_spawned == 3);
        REQUIRE(traj.stats().rays_cycled == 3);
        REQUIRE(traj.stats().rays_absorbed == 0);
    }
}

TEST_CASE("Refract fork count grows by one per crossing", "[tracer]") {
    // 1x1 の Refract の周りを回る光線は辺を4回横切る
    auto board = make_board({"C"}, Inventory(), {}, {});
    Placement config(board);

    auto traj = trace(config, {{0, 1}, 1, 1});
    std::vector<Point> expected = {{0, 1}, {1, 2}, {2, 1}, {1, 0}};
    REQUIRE(traj.points() == expected);
    REQUIRE(traj.stats().rays_spawned == 5);
    REQUIRE(traj.stats().rays_cycled == 5);
    REQUIRE(traj.stats().peak_active >= 2);
}

// ============================================================================
// 命中判定
// ============================================================================

TEST_CASE("Target hits are exact lattice matches", "[tracer]") {
    auto board = make_board({"oo", "oo"}, Inventory(), {{{0, 0}, 1, 1}},
                            {{2, 2}, {2, 0}, {4, 4}, {3, 2}});
    Placement config(board);

    auto hits = evaluate(config);
    REQUIRE(hits == std::vector<bool>{true, false, true, false});

    RayTracer tracer(board);
    std::vector<bool> buffer;
    REQUIRE(tracer.count_hits(config, buffer) == 2);
    REQUIRE(tracer.visited({1, 1}));
    REQUIRE_FALSE(tracer.visited({1, 3}));
    REQUIRE_FALSE(tracer.visited({9, 9}));
}

TEST_CASE("trace_all is the union of all lasers", "[tracer]") {
    auto board = make_board({"oo", "oo"}, Inventory(),
                            {{{0, 0}, 1, 1}, {{4, 0}, -1, 1}}, {});
    Placement config(board);
    RayTracer tracer(board);

    auto all = tracer.trace_all(config);
    Trajectory merged;
    merged.merge(tracer.trace(config, board.lasers()[0]));
    merged.merge(tracer.trace(config, board.lasers()[1]));

    REQUIRE(sorted_points(all) == sorted_points(merged));
    REQUIRE(all.contains({0, 4}));
    REQUIRE(all.contains({4, 4}));
    REQUIRE(all.stats().rays_spawned == 2);
}

TEST_CASE("Tracing is deterministic and reuses buffers safely", "[tracer]") {
    auto board = make_board({"oAo", "CoB", "ooC"}, Inventory(), {{{0, 3}, 1, -1}}, {});
    Placement config(board);
    RayTracer tracer(board);

    auto first = tracer.trace(config, board.lasers()[0]);
    for (int i = 0; i < 10; ++i) {
        auto again = tracer.trace(config, board.lasers()[0]);
        REQUIRE(again.points() == first.points());
        REQUIRE(again.stats().rays_spawned == first.stats().rays_spawned);
    }
    RayTracer fresh(board);
    REQUIRE(fresh.trace(config, board.lasers()[0]).points() == first.points());
}

// ============================================================================
// 衝突判定方式の相互検証
// ============================================================================

TEST_CASE("Wall and center collision models agree on random boards", "[tracer]") {
    std::mt19937 rng(12345);
    const char symbols[] = {'o', 'o', 'o', 'x', 'A', 'B', 'C'};

    for (int iter = 0; iter < 200; ++iter) {
        int w = 1 + static_cast<int>(rng() % 5);
        int h = 1 + static_cast<int>(rng() % 5);
        std::vector<std::string> rows(static_cast<size_t>(h));
        for (auto& row : rows) {
            for (int c = 0; c < w; ++c) {
                row += symbols[rng() % sizeof(symbols)];
            }
        }

        std::vector<Laser> lasers;
        for (int i = 0; i < 3; ++i) {
            Point origin{static_cast<int>(rng() % static_cast<unsigned>(2 * w + 1)),
                         static_cast<int>(rng() % static_cast<unsigned>(2 * h + 1))};
            lasers.push_back({origin, (rng() & 1) ? 1 : -1, (rng() & 2) ? 1 : -1});
        }

        auto board = make_board(rows, Inventory(), lasers, {});
        Placement config(board);
        RayTracer wall(board, CollisionModel::Wall);
        RayTracer center(board, CollisionModel::Center);

        for (const auto& laser : board.lasers()) {
            auto a = wall.trace(config, laser);
            auto b = center.trace(config, laser);
            REQUIRE(a.points() == b.points());
            REQUIRE(a.stats().rays_spawned == b.stats().rays_spawned);
            REQUIRE(a.stats().rays_absorbed == b.stats().rays_absorbed);
        }
    }
}
