#include <gtest/gtest.h>

#include "sidebar_options.hpp"

#include <cstdint>

TEST(SidebarOptions, DefaultsMatchControllerSettings)
{
    convo::config::OptionRegistry registry("convo-chat-test");
    convo::chat::registerSidebarOptions(registry);

    const auto settings = convo::chat::sidebarSettings(registry);
    const convo::sidebar::SidebarController::Settings defaults;
    EXPECT_EQ(settings.estimatedItemHeight, defaults.estimatedItemHeight);
    EXPECT_EQ(settings.overscan, defaults.overscan);
    EXPECT_EQ(settings.endReachedThreshold, defaults.endReachedThreshold);
    EXPECT_EQ(registry.getInteger(convo::chat::kOptionPageSize), 20);
    EXPECT_TRUE(registry.getBool(convo::chat::kOptionShowLastMessage));
    EXPECT_TRUE(registry.getString(convo::chat::kOptionConversationsFile).empty());
}

TEST(SidebarOptions, RowHeightEstimateNeverDropsBelowOne)
{
    convo::config::OptionRegistry registry("convo-chat-test");
    convo::chat::registerSidebarOptions(registry);

    registry.set(convo::chat::kOptionEstimatedRowHeight, convo::config::OptionValue(std::int64_t{0}));
    registry.set(convo::chat::kOptionOverscan, convo::config::OptionValue(std::int64_t{12}));

    const auto settings = convo::chat::sidebarSettings(registry);
    EXPECT_EQ(settings.estimatedItemHeight, 1);
    EXPECT_EQ(settings.overscan, 12u);
}
