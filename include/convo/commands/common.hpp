#pragma once

#include <cstdint>

namespace convo::commands::common
{

inline constexpr std::uint16_t About = 2100;

} // namespace convo::commands::common
