#include "lazor/bff/board_file.hpp"
#include "lazor/explorer.hpp"
#include "lazor/solver.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

std::atomic<bool> g_interrupted{false};
lazor::Solver* g_current_solver = nullptr;
lazor::Explorer* g_current_explorer = nullptr;

void interrupt_handler(int) {
    g_interrupted = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
    if (g_current_explorer) {
        g_current_explorer->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-p] [-j N] [-S seed,...] [-c wall|center] [-s] [-v] [-t SEC] <file.bff>...\n";
    std::cerr << "  -p        Multi-seed parallel search\n";
    std::cerr << "  -j N      Number of worker threads (with -p)\n";
    std::cerr << "  -S LIST   Comma separated seeds (single mode uses the first)\n";
    std::cerr << "  -c MODEL  Collision model: wall (default) or center\n";
    std::cerr << "  -s        Print solver statistics to stderr\n";
    std::cerr << "  -v        Verbose mode (print search progress)\n";
    std::cerr << "  -t SEC    Time limit in seconds per board (default 180, 0 = none)\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const lazor::Solution& sol) {
    if (!g_print_stats) return;
    const auto& s = sol.stats;
    std::cerr << "% Stats: mode=" << lazor::mode_name(sol.mode)
              << " seed=" << sol.seed
              << " nodes=" << s.nodes
              << " traces=" << s.traces
              << " subsets=" << s.subsets_tried
              << " max_depth=" << s.max_depth
              << " best_hits=" << s.best_hits
              << " timed_out=" << (s.timed_out ? 1 : 0)
              << " cancelled=" << (s.cancelled ? 1 : 0)
              << " elapsed=" << sol.elapsed_seconds << "s"
              << "\n";
}

/**
 * @brief 配置後の盤面を記号で描画
 *
 * 置いたブロックは記号の後に '*' を付ける。
 */
void print_board(const lazor::Board& board, const lazor::Solution& sol) {
    std::vector<std::string> rows(static_cast<size_t>(board.height()));
    for (int r = 0; r < board.height(); ++r) {
        for (int c = 0; c < board.width(); ++c) {
            lazor::Cell cell{r, c};
            std::string token;
            switch (board.kind(cell)) {
                case lazor::CellKind::Empty: token = "o "; break;
                case lazor::CellKind::Forbidden: token = "x "; break;
                case lazor::CellKind::Fixed:
                    token = std::string(1, lazor::block_symbol(*board.fixed_block(cell))) + " ";
                    break;
            }
            for (const auto& pb : sol.placement) {
                if (pb.cell == cell) {
                    token = std::string(1, lazor::block_symbol(pb.type)) + "*";
                }
            }
            rows[static_cast<size_t>(r)] += token + " ";
        }
    }
    for (const auto& row : rows) {
        std::cout << "  " << row << "\n";
    }
}

void print_solution(const lazor::Board& board, const lazor::Solution& sol) {
    print_board(board, sol);

    std::cout << "placement:";
    if (sol.placement.empty()) {
        std::cout << " (none)";
    }
    std::cout << "\n";
    for (const auto& pb : sol.placement) {
        std::cout << "  " << lazor::block_symbol(pb.type) << " at "
                  << lazor::to_string(pb.cell) << "\n";
    }

    std::cout << "targets:\n";
    for (size_t i = 0; i < board.targets().size(); ++i) {
        bool hit = i < sol.target_hits.size() && sol.target_hits[i];
        std::cout << "  " << lazor::to_string(board.targets()[i]) << " "
                  << (hit ? "hit" : "miss") << "\n";
    }

    std::cout << (sol.solved ? "SOLVED" : "NOT SOLVED") << "\n";
}

bool parse_seeds(const char* text, std::vector<uint64_t>& seeds) {
    std::stringstream ss(text);
    std::string item;
    seeds.clear();
    while (std::getline(ss, item, ',')) {
        if (item.empty()) return false;
        char* end = nullptr;
        unsigned long long v = std::strtoull(item.c_str(), &end, 10);
        if (*end != '\0' || item[0] == '-') return false;
        seeds.push_back(static_cast<uint64_t>(v));
    }
    return !seeds.empty();
}

int main(int argc, char* argv[]) {
    bool parallel = false;
    size_t workers = 0;
    std::vector<uint64_t> seeds;
    lazor::CollisionModel collision = lazor::CollisionModel::Wall;
    double time_limit = 180.0;
    std::vector<const char*> filenames;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-p") == 0) {
            parallel = true;
        } else if (std::strcmp(argv[i], "-j") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n <= 0) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
            workers = static_cast<size_t>(n);
        } else if (std::strcmp(argv[i], "-S") == 0 && i + 1 < argc) {
            if (!parse_seeds(argv[++i], seeds)) {
                std::cerr << "Invalid seed list: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            ++i;
            if (std::strcmp(argv[i], "wall") == 0) {
                collision = lazor::CollisionModel::Wall;
            } else if (std::strcmp(argv[i], "center") == 0) {
                collision = lazor::CollisionModel::Center;
            } else {
                std::cerr << "Unknown collision model: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            time_limit = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filenames.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (filenames.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, interrupt_handler);

    lazor::SearchOptions options;
    options.time_limit = time_limit;
    options.collision = collision;
    options.verbose = g_verbose;
    if (!seeds.empty()) {
        options.seed = seeds.front();
    }

    size_t solved_count = 0;
    bool input_error = false;

    for (const char* filename : filenames) {
        if (g_interrupted) break;

        std::cout << "== " << filename << "\n";
        try {
            auto board = lazor::bff::load_board(filename);

            lazor::Solution sol;
            if (parallel) {
                lazor::Explorer explorer(options);
                explorer.set_seeds(seeds);
                explorer.set_workers(workers);
                g_current_explorer = &explorer;
                sol = explorer.solve(board);
                g_current_explorer = nullptr;
            } else {
                lazor::Solver solver(options);
                g_current_solver = &solver;
                sol = solver.solve(board);
                g_current_solver = nullptr;
            }

            print_stats(sol);
            print_solution(board, sol);
            std::cout << "summary: " << filename
                      << " " << (sol.solved ? "solved" : "unsolved")
                      << " hits=" << sol.hit_count << "/" << board.targets().size()
                      << " blocks=" << sol.placement.size()
                      << " mode=" << lazor::mode_name(sol.mode)
                      << " collision=" << lazor::collision_name(sol.collision)
                      << " seed=" << sol.seed
                      << " time=" << sol.elapsed_seconds << "s\n";
            if (sol.solved) {
                ++solved_count;
            }
        } catch (const std::exception& e) {
            g_current_solver = nullptr;
            g_current_explorer = nullptr;
            std::cerr << "Error: " << filename << ": " << e.what() << "\n";
            input_error = true;
        }
    }

    if (input_error) {
        return 1;
    }
    return solved_count == filenames.size() ? 0 : 2;
}
