#pragma once

#include "convo/options.hpp"
#include "convo/sidebar/sidebar_controller.hpp"

namespace convo::chat
{

inline constexpr char kOptionEstimatedRowHeight[] = "estimatedRowHeight";
inline constexpr char kOptionOverscan[] = "overscan";
inline constexpr char kOptionEndReachedThreshold[] = "endReachedThreshold";
inline constexpr char kOptionPageSize[] = "pageSize";
inline constexpr char kOptionShowLastMessage[] = "showLastMessage";
inline constexpr char kOptionConversationsFile[] = "conversationsFile";
inline constexpr char kOptionLogFile[] = "logFile";

void registerSidebarOptions(config::OptionRegistry &registry);

sidebar::SidebarController::Settings sidebarSettings(const config::OptionRegistry &registry);

} // namespace convo::chat
