#pragma once

#include <span>
#include <string_view>

namespace convo::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view aboutDescription;
    std::string_view longDescription;
};

std::span<const ToolInfo> tools() noexcept;
const ToolInfo *findTool(std::string_view id) noexcept;
// Throws std::runtime_error for unknown ids.
const ToolInfo &requireTool(std::string_view id);

} // namespace convo::appinfo
