#pragma once

#include <cstdint>
#include <string>

namespace upgate::util {

// "5.0MB" style size for limits and messages; sizes under 1 MiB print in bytes
std::string formatMegabytes(std::uintmax_t bytes);

}  // namespace upgate::util
