#include "core/game_state.hpp"
#include "game/game_utils.hpp"
#include "mcts/mcts_engine.hpp"
#include "utils/profiler.hpp"
#include "utils/timer.hpp"
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

// How to run: ./hobogo_selfplay --games 10 --size 7 --bots 3 --iterations 2000
namespace {

struct SelfPlayConfig {
    int games = 4;
    int board_size = 7;
    int num_bots = 2;
    int iterations = 0;          // 0: use think_time instead
    double think_time = 0.1;     // seconds per move
    uint32_t seed = 1;
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --games N       games to play (default 4)\n"
              << "  --size N        board size (default 7)\n"
              << "  --bots N        bot players, 2..16 (default 2)\n"
              << "  --iterations N  fixed MCTS iterations per move\n"
              << "  --think S       seconds per move when no iteration count is given (default 0.1)\n"
              << "  --seed N        base random seed (default 1)\n"
              << "  --verbose       print every board\n";
}

const char* require_value(int& i, int argc, char* argv[]) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

SelfPlayConfig parse_args(int argc, char* argv[]) {
    SelfPlayConfig config;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--games") == 0) {
            config.games = std::stoi(require_value(i, argc, argv));
        } else if (std::strcmp(argv[i], "--size") == 0) {
            config.board_size = std::stoi(require_value(i, argc, argv));
        } else if (std::strcmp(argv[i], "--bots") == 0) {
            config.num_bots = std::stoi(require_value(i, argc, argv));
        } else if (std::strcmp(argv[i], "--iterations") == 0) {
            config.iterations = std::stoi(require_value(i, argc, argv));
        } else if (std::strcmp(argv[i], "--think") == 0) {
            config.think_time = std::stod(require_value(i, argc, argv));
        } else if (std::strcmp(argv[i], "--seed") == 0) {
            config.seed = static_cast<uint32_t>(std::stoul(require_value(i, argc, argv)));
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else {
            throw std::invalid_argument(std::string("unknown option ") + argv[i]);
        }
    }

    if (config.games < 1) {
        throw std::invalid_argument("--games must be at least 1");
    }
    if (config.iterations < 0 || config.think_time <= 0.0) {
        throw std::invalid_argument("search budget must be positive");
    }
    return config;
}

struct GameResult {
    std::vector<int> points;
    int moves = 0;
    int passes = 0;
    double seconds = 0.0;
};

GameResult play_game(const SelfPlayConfig& config, mcts::Rng& rng) {
    core::GameState state(config.board_size, config.num_bots, 0);
    GameResult result;
    utils::Timer timer;
    timer.start();

    while (!state.is_terminal()) {
        mcts::MCTSEngine engine(state);
        std::optional<core::Action> choice =
            config.iterations > 0
                ? engine.search(rng, config.iterations)
                : engine.search(rng, std::chrono::duration<double>(config.think_time));
        core::Action action = choice.value_or(core::Action::pass());

        if (config.verbose) {
            std::cout << "Player " << static_cast<int>(state.next_player()) << ": "
                      << game::GameUtils::action_name(action) << " after " << engine.iterations()
                      << " iterations\n";
            engine.print_stats(std::cout, 3);
        }

        state.play(action);
        if (action.is_pass()) {
            result.passes++;
        } else {
            result.moves++;
        }

        if (config.verbose) {
            game::GameUtils::print_board(std::cout, state);
        }
    }

    result.points = state.points();
    result.seconds = timer.elapsed_seconds();
    return result;
}

} // namespace

int main(int argc, char* argv[]) {
    SelfPlayConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::cout << "HOBOGO self-play: " << config.games << " game(s), " << config.board_size << "x"
                  << config.board_size << ", " << config.num_bots << " bots, ";
        if (config.iterations > 0) {
            std::cout << config.iterations << " iterations/move";
        } else {
            std::cout << game::GameUtils::format_duration(config.think_time) << "/move";
        }
        std::cout << ", seed " << config.seed << "\n\n";

        mcts::Rng rng(config.seed);
        std::vector<int> wins(config.num_bots, 0);
        int draws = 0;
        std::vector<long> total_points(config.num_bots, 0);
        utils::Timer total;
        total.start();

        for (int g = 0; g < config.games; ++g) {
            GameResult result = play_game(config, rng);

            auto leader = game::GameUtils::sole_leader(result.points);
            if (leader) {
                wins[*leader]++;
            } else {
                draws++;
            }

            std::cout << "Game " << std::setw(3) << (g + 1) << ": ";
            for (int p = 0; p < config.num_bots; ++p) {
                std::cout << std::setw(4) << result.points[p];
                total_points[p] += result.points[p];
            }
            std::cout << "   moves " << result.moves << ", passes " << result.passes << ", "
                      << game::GameUtils::format_duration(result.seconds) << "\n";
        }

        std::cout << "\n=== Summary ===\n";
        for (int p = 0; p < config.num_bots; ++p) {
            std::cout << "Player " << p << ": " << wins[p] << " win(s), average "
                      << std::fixed << std::setprecision(1)
                      << static_cast<double>(total_points[p]) / config.games << " points\n";
        }
        std::cout << "Draws: " << draws << "\n";
        std::cout << "Total time: " << game::GameUtils::format_duration(total.elapsed_seconds()) << "\n";

        utils::Profiler::instance().print_report(std::cout);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
