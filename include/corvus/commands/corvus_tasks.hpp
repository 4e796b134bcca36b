#pragma once

#include <cstdint>

namespace corvus::commands::tasks
{

inline constexpr std::uint16_t Copy = 3001;
inline constexpr std::uint16_t Move = 3002;
inline constexpr std::uint16_t Delete = 3003;
inline constexpr std::uint16_t CreateFile = 3004;
inline constexpr std::uint16_t CreateDirectory = 3005;
inline constexpr std::uint16_t Chmod = 3006;
inline constexpr std::uint16_t Chown = 3007;
inline constexpr std::uint16_t Unmount = 3008;
inline constexpr std::uint16_t Archive = 3009;

inline constexpr std::uint16_t ShowLog = 3100;
inline constexpr std::uint16_t ClearMessage = 3101;

inline constexpr std::uint16_t SaveDefaults = 3200;
inline constexpr std::uint16_t About = 3300;

} // namespace corvus::commands::tasks
