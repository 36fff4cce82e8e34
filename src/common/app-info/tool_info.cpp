#include "convo/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace convo::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "convo-chat",
                "convo-chat",
                "Conversations",
                "Browse pinned, foldered and recent conversations.",
                "Browse pinned, foldered and recent conversations in a windowed sidebar.",
                "Conversations keeps a long chat history navigable inside the terminal. Pinned threads stay on top, folders group related work and everything else lands in Recent. Only the rows on screen are drawn, so scrolling stays smooth while older pages load on demand as you reach the end of the list."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

} // namespace convo::appinfo
