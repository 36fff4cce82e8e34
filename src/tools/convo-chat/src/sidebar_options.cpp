#include "sidebar_options.hpp"

#include <cstdint>
#include <string>

namespace convo::chat
{

void registerSidebarOptions(config::OptionRegistry &registry)
{
  registry.registerOption({kOptionEstimatedRowHeight, config::OptionKind::Integer,
                           config::OptionValue(std::int64_t{2}), "Estimated Row Height",
                           "Lines reserved for a row before it has been drawn.",
                           std::int64_t{1}, std::int64_t{10}});
  registry.registerOption({kOptionOverscan, config::OptionKind::Integer,
                           config::OptionValue(std::int64_t{5}), "Overscan",
                           "Rows drawn beyond each edge of the visible area.",
                           std::int64_t{0}, std::int64_t{50}});
  registry.registerOption({kOptionEndReachedThreshold, config::OptionKind::Integer,
                           config::OptionValue(std::int64_t{3}), "Load-More Threshold",
                           "Start loading the next page this many rows before the end.",
                           std::int64_t{0}, std::int64_t{50}});
  registry.registerOption({kOptionPageSize, config::OptionKind::Integer,
                           config::OptionValue(std::int64_t{20}), "Page Size",
                           "Conversations requested per page.",
                           std::int64_t{1}, std::int64_t{500}});
  registry.registerOption({kOptionShowLastMessage, config::OptionKind::Boolean,
                           config::OptionValue(true), "Show Last Message",
                           "Draw a preview line under each conversation title."});
  registry.registerOption({kOptionConversationsFile, config::OptionKind::String,
                           config::OptionValue(std::string()), "Conversations File",
                           "JSON file to read conversations from. Empty uses sample data."});
  registry.registerOption({kOptionLogFile, config::OptionKind::String,
                           config::OptionValue(std::string()), "Log File",
                           "Where to write the session log. Empty writes beside the binary."});
}

sidebar::SidebarController::Settings sidebarSettings(const config::OptionRegistry &registry)
{
  sidebar::SidebarController::Settings settings;
  settings.estimatedItemHeight = static_cast<int>(registry.getInteger(kOptionEstimatedRowHeight, 2));
  settings.overscan = static_cast<std::size_t>(registry.getInteger(kOptionOverscan, 5));
  settings.endReachedThreshold = static_cast<std::size_t>(registry.getInteger(kOptionEndReachedThreshold, 3));
  return settings;
}

} // namespace convo::chat
