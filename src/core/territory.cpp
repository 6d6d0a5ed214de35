#include "core/territory.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace core {

namespace {

constexpr int dx[] = {1, -1, 0, 0};
constexpr int dy[] = {0, 0, 1, -1};

} // namespace

void Territory::analyze(const Board& board, int num_players) {
    if (num_players < 1 || num_players > MAX_PLAYERS) {
        throw std::invalid_argument("Territory: player count out of range: " +
                                    std::to_string(num_players));
    }

    width_ = board.width();
    height_ = board.height();
    stone_count_ = board.stone_count();
    cell_count_ = board.cell_count();
    num_players_ = num_players;
    cells_.assign(board.cells().begin(), board.cells().end());

    distances_.assign(cell_count_ * num_players, UNREACHABLE);
    influence_.assign(cell_count_, Influence{});
    volatile_.assign(cell_count_, false);
    has_stones_.fill(false);

    for (const Cell& cell : board.cells()) {
        if (cell && *cell < num_players) {
            has_stones_[*cell] = true;
        }
    }

    all_players_placed_ = true;
    for (int p = 0; p < num_players; ++p) {
        if (!has_stones_[p]) {
            all_players_placed_ = false;
        } else {
            flood(board, static_cast<Player>(p));
        }
    }

    volatile_count_ = 0;
    for (std::size_t i = 0; i < cell_count_; ++i) {
        const Cell& cell = board.at(i);
        if (cell) {
            influence_[i] = Influence{*cell, true};
            continue;
        }

        if (!all_players_placed_) {
            // Someone can still drop a first stone anywhere
            volatile_[i] = true;
            ++volatile_count_;
            continue;
        }

        int best = UNREACHABLE;
        int best_count = 0;
        int reach = 0;
        Player claimant = 0;
        for (int p = 0; p < num_players; ++p) {
            int d = distances_[static_cast<std::size_t>(p) * cell_count_ + i];
            if (d == UNREACHABLE) continue;
            ++reach;
            if (d < best) {
                best = d;
                best_count = 1;
                claimant = static_cast<Player>(p);
            } else if (d == best) {
                ++best_count;
            }
        }

        if (reach > 0 && best_count == 1) {
            influence_[i].claimant = claimant;
        }

        // reach == 1 means the region is sealed by a single player
        if (reach != 1) {
            volatile_[i] = true;
            ++volatile_count_;
        }
    }
}

void Territory::flood(const Board& board, Player player) {
    int* dist = distances_.data() + static_cast<std::size_t>(player) * cell_count_;

    queue_.clear();
    for (std::size_t i = 0; i < cell_count_; ++i) {
        const Cell& cell = board.at(i);
        if (cell && *cell == player) {
            dist[i] = 0;
            queue_.push_back(static_cast<int>(i));
        }
    }

    // Multi-source BFS through empty cells only
    for (std::size_t head = 0; head < queue_.size(); ++head) {
        int current = queue_[head];
        int x = current % width_;
        int y = current / width_;
        for (int dir = 0; dir < 4; ++dir) {
            int nx = x + dx[dir];
            int ny = y + dy[dir];
            if (nx < 0 || nx >= width_ || ny < 0 || ny >= height_) continue;

            int next = ny * width_ + nx;
            if (dist[next] != UNREACHABLE || board.at(next)) continue;

            dist[next] = dist[current] + 1;
            queue_.push_back(next);
        }
    }
}

std::vector<int> Territory::points() const {
    std::vector<int> score(num_players_, 0);
    for (const Influence& inf : influence_) {
        if (inf.claimant && *inf.claimant < num_players_) {
            ++score[*inf.claimant];
        }
    }
    return score;
}

} // namespace core
