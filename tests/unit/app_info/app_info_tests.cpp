#include <gtest/gtest.h>

#include "corvus/app_info.hpp"

#include <stdexcept>

TEST(AppInfo, ListsTheTaskTool)
{
    auto tools = corvus::appinfo::tools();
    ASSERT_FALSE(tools.empty());
    EXPECT_NE(corvus::appinfo::findTool("corvus-tasks"), nullptr);
    EXPECT_EQ(corvus::appinfo::findTool("does-not-exist"), nullptr);
}

TEST(AppInfo, RequireToolReturnsMatchingExecutable)
{
    const auto &info = corvus::appinfo::requireTool("corvus-tasks");
    EXPECT_EQ(info.id, "corvus-tasks");
    EXPECT_EQ(info.executable, "corvus-tasks");
    EXPECT_FALSE(info.displayName.empty());
    EXPECT_FALSE(info.shortDescription.empty());
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_THROW(corvus::appinfo::requireTool("does-not-exist"), std::runtime_error);
}
