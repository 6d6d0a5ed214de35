#include "game/settings.hpp"
#include <algorithm>

namespace game {

Settings Settings::normalized() const {
    Settings s = *this;
    s.board_size = std::clamp(s.board_size, MIN_BOARD_SIZE, MAX_BOARD_SIZE);
    s.num_humans = std::clamp(s.num_humans, 0, MAX_HUMANS);
    s.num_bots = std::clamp(s.num_bots, 0, MAX_BOTS);
    s.bot_think_time = std::clamp(s.bot_think_time, MIN_THINK_TIME, MAX_THINK_TIME);

    while (s.num_players() < 2) {
        s.num_humans++;
    }
    // Without bots, "bots first" would start with a player who does not exist
    if (s.num_bots == 0) {
        s.humans_first = true;
    }
    return s;
}

} // namespace game
