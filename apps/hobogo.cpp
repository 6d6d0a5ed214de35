#include "game/bot_worker.hpp"
#include "game/game_utils.hpp"
#include "game/match.hpp"
#include "utils/profiler.hpp"
#include "utils/timer.hpp"
#include <chrono>
#include <cstring>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

// How to run: ./hobogo --size 9 --humans 1 --bots 2 --think 1.5
namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --size N        board size, 5..17 (default 9)\n"
              << "  --humans N      human players, 0..4 (default 1)\n"
              << "  --bots N        bot players, 0..4 (default 1)\n"
              << "  --bots-first    bots move before humans\n"
              << "  --think S       bot think time in seconds (default 1.0)\n"
              << "  --seed N        seed for the bots' random source\n";
}

void print_commands() {
    std::cout << "Commands: a coordinate like C3 to place a stone, "
              << "'undo', 'new', 'help', 'quit'\n";
}

const char* require_value(int& i, int argc, char* argv[]) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

int main(int argc, char* argv[]) {
    game::Settings settings;
    uint32_t seed = std::random_device{}();

    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--size") == 0) {
                settings.board_size = std::stoi(require_value(i, argc, argv));
            } else if (std::strcmp(argv[i], "--humans") == 0) {
                settings.num_humans = std::stoi(require_value(i, argc, argv));
            } else if (std::strcmp(argv[i], "--bots") == 0) {
                settings.num_bots = std::stoi(require_value(i, argc, argv));
            } else if (std::strcmp(argv[i], "--bots-first") == 0) {
                settings.humans_first = false;
            } else if (std::strcmp(argv[i], "--think") == 0) {
                settings.bot_think_time = std::stod(require_value(i, argc, argv));
            } else if (std::strcmp(argv[i], "--seed") == 0) {
                seed = static_cast<uint32_t>(std::stoul(require_value(i, argc, argv)));
            } else if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                throw std::invalid_argument(std::string("unknown option ") + argv[i]);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        game::Match match(settings);
        game::BotWorker worker;
        std::mt19937 seeder(seed);

        std::cout << "HOBOGO " << match.settings().board_size << "x" << match.settings().board_size
                  << ", " << match.settings().num_humans << " human(s), "
                  << match.settings().num_bots << " bot(s), seed " << seed << "\n";
        game::GameUtils::print_legend(std::cout);
        print_commands();

        while (true) {
            std::cout << "\n";
            game::GameUtils::print_match(std::cout, match);

            if (!match.is_game_over() && !match.next_player_is_human()) {
                core::Player bot = match.state().next_player();
                utils::Timer timer;
                timer.start();
                worker.start(match.state(), std::chrono::duration<double>(match.settings().bot_think_time),
                             static_cast<uint32_t>(seeder()));
                while (worker.status() == game::BotWorker::Status::Thinking) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                auto choice = worker.take();
                core::Action action = choice.value_or(core::Action::pass());
                match.apply(action);

                std::cout << match.player_name(bot) << " plays " << game::GameUtils::action_name(action)
                          << " (" << worker.last_iterations() << " iterations in "
                          << game::GameUtils::format_duration(timer.elapsed_seconds()) << ")\n";
                continue;
            }

            std::cout << "> " << std::flush;
            std::string input;
            if (!std::getline(std::cin, input) || input == "quit" || input == "q") {
                break;
            }

            if (input.empty()) {
                continue;
            } else if (input == "help") {
                game::GameUtils::print_legend(std::cout);
                print_commands();
            } else if (input == "undo") {
                if (!match.undo()) {
                    std::cout << "Nothing to undo." << std::endl;
                }
            } else if (input == "new") {
                match.new_game();
            } else if (match.is_game_over()) {
                std::cout << "The game is over: 'new', 'undo' or 'quit'." << std::endl;
            } else {
                auto coord = game::GameUtils::parse_coord(input);
                if (!coord) {
                    std::cout << "Invalid input: " << input << std::endl;
                } else if (!match.play_human(*coord)) {
                    std::cout << "Illegal move: " << input << std::endl;
                }
            }
        }

        utils::Profiler::instance().print_report(std::cout);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
