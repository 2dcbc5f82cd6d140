#include "string_util.hpp"

namespace ember {
namespace utils {

std::vector<std::string> split_text(const std::string &s,
                                    const std::string &delimiter) {
  std::vector<std::string> result;
  for (auto &&subrange : std::ranges::split_view(s, delimiter))
    result.emplace_back(subrange.begin(), subrange.end());
  return result;
}

bool is_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) {
    return std::isdigit(ch);
  });
}

} // namespace utils
} // namespace ember
