#include "arena/BasicTypes.hpp"

#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <magic_enum/magic_enum.hpp>

namespace arena {

inline PlayerColor from_seat(int seat) {
  if (seat < 0 || seat >= kNumPlayers) {
    throw util::Exception("Invalid seat {} (expected 0 or 1)", seat);
  }
  return magic_enum::enum_value<PlayerColor>(seat);
}

inline std::string_view color_name(PlayerColor color) {
  // enumerator names carry a 'k' prefix
  return magic_enum::enum_name(color).substr(1);
}

inline PlayerColor parse_color(const std::string& str) {
  std::string lowered = util::to_lower(str);
  for (PlayerColor color : magic_enum::enum_values<PlayerColor>()) {
    if (util::to_lower(std::string(color_name(color))) == lowered) {
      return color;
    }
  }
  throw util::CleanException("Invalid color \"{}\" (expected Black or White)", str);
}

}  // namespace arena
