#pragma once

#include <string_view>

#define SUPEX_VERSION_MAJOR 0
#define SUPEX_VERSION_MINOR 1
#define SUPEX_VERSION_PATCH 0
#define SUPEX_VERSION_STRING "0.1.0"

namespace supex {

/// Name sent in the hello handshake
inline constexpr std::string_view kClientName{"supex-driver"};
inline constexpr std::string_view kClientVersion{SUPEX_VERSION_STRING};

}  // namespace supex
