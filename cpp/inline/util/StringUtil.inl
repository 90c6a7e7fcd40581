#include "util/StringUtil.hpp"

#include <cctype>
#include <sstream>

namespace util {

inline std::vector<std::string> split(const std::string& s, const char* sep) {
  std::vector<std::string> pieces;
  const std::string separator(sep);

  if (separator.empty()) {
    std::istringstream stream(s);
    std::string word;
    while (stream >> word) {
      pieces.push_back(word);
    }
    return pieces;
  }

  size_t begin = 0;
  for (size_t hit = s.find(separator); hit != std::string::npos; hit = s.find(separator, begin)) {
    pieces.push_back(s.substr(begin, hit - begin));
    begin = hit + separator.size();
  }
  pieces.push_back(s.substr(begin));
  return pieces;
}

inline std::vector<std::string> splitlines(const std::string& s) {
  std::vector<std::string> lines;
  std::istringstream stream(s);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

inline std::string to_lower(const std::string& s) {
  std::string lowered;
  lowered.reserve(s.size());
  for (char c : s) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered;
}

inline std::string grammatically_join(const std::vector<std::string>& items,
                                      const std::string& conjunction, bool oxford_comma) {
  const size_t n = items.size();
  if (n <= 2) {
    std::string joined = n ? items[0] : "";
    if (n == 2) joined += " " + conjunction + " " + items[1];
    return joined;
  }

  std::string joined;
  for (size_t i = 0; i + 1 < n; ++i) {
    joined += items[i];
    if (i + 2 < n || oxford_comma) joined += ",";
    joined += " ";
  }
  return joined + conjunction + " " + items[n - 1];
}

}  // namespace util
