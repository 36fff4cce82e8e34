#pragma once

#include <cstdint>

#include "convo/commands/common.hpp"

namespace convo::commands::chat
{

inline constexpr std::uint16_t About = convo::commands::common::About;
inline constexpr std::uint16_t NewConversation = 1000;
inline constexpr std::uint16_t OpenConversation = 1001;
inline constexpr std::uint16_t TogglePin = 1002;
inline constexpr std::uint16_t MoveToFolder = 1003;
inline constexpr std::uint16_t Archive = 1004;
inline constexpr std::uint16_t RestoreArchived = 1005;
inline constexpr std::uint16_t RenameConversation = 1006;
inline constexpr std::uint16_t DeleteConversation = 1007;
inline constexpr std::uint16_t NewFolder = 1100;
inline constexpr std::uint16_t RenameFolder = 1101;
inline constexpr std::uint16_t DeleteFolder = 1102;
inline constexpr std::uint16_t ExpandAllFolders = 1103;
inline constexpr std::uint16_t CollapseAllFolders = 1104;
inline constexpr std::uint16_t LoadMore = 1200;
inline constexpr std::uint16_t Search = 1201;
inline constexpr std::uint16_t ClearSearch = 1202;
inline constexpr std::uint16_t ShowLastMessage = 1203;
inline constexpr std::uint16_t ProjectAll = 1300;
inline constexpr std::uint16_t ProjectBase = 1301;
inline constexpr std::uint16_t ProjectLimit = 10;

} // namespace convo::commands::chat
