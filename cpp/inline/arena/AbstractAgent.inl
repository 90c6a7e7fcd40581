#include "arena/AbstractAgent.hpp"

namespace arena {

template <concepts::Game Game>
void AbstractAgent<Game>::init_game(game_id_t game_id, PlayerColor color) {
  game_id_ = game_id;
  my_color_ = color;
}

}  // namespace arena
