#include "exception.hpp"

#include <cpptrace/cpptrace.hpp>

namespace ember {

std::string build_trace() {
  auto trace = cpptrace::generate_trace();
  auto &frames = trace.frames;
  while (!frames.empty()) {
    auto front_symbol = frames.at(0).symbol;
    if (front_symbol.starts_with("ember::build_trace") ||
        front_symbol.starts_with("ember::exception_base_t") ||
        front_symbol.starts_with("ember::exception_t"))
      frames.erase(frames.begin());
    else
      break;
  }
  return trace.to_string(false);
}

} // namespace ember
