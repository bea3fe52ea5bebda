#include "upgate/util/format.hpp"

#include <fmt/format.h>

namespace upgate::util {

std::string formatMegabytes(std::uintmax_t bytes) {
  constexpr std::uintmax_t kMebibyte = 1024 * 1024;
  if (bytes < kMebibyte) {
    return fmt::format("{} bytes", bytes);
  }
  return fmt::format("{:.1f}MB", static_cast<double>(bytes) / static_cast<double>(kMebibyte));
}

}  // namespace upgate::util
