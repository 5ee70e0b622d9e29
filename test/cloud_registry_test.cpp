#include "pcimport/cloud/cloud_registry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

using namespace pcimport;

namespace {

std::shared_ptr<PointCloud> MakeCloud(const std::string& name, int points) {
    auto cloud = std::make_shared<PointCloud>(name);
    std::vector<Point3f> batch(points);
    cloud->AppendBatch(std::move(batch));
    return cloud;
}

TEST(CloudRegistryTest, AddAndFind) {
    CloudRegistry registry;
    auto first = MakeCloud("first", 3);
    registry.Add(first);
    registry.Add(MakeCloud("second", 5));

    EXPECT_EQ(registry.Size(), 2);
    EXPECT_EQ(registry.Find("first"), first);
    EXPECT_EQ(registry.Find("missing"), nullptr);
    EXPECT_EQ(registry.Active()->name(), "second");
    EXPECT_EQ(registry.TotalPoints(), 8);
}

TEST(CloudRegistryTest, SameNameReplacesAndDisposes) {
    CloudRegistry registry;
    auto old_cloud = MakeCloud("scan", 3);
    auto new_cloud = MakeCloud("scan", 4);
    registry.Add(old_cloud);
    registry.Add(MakeCloud("other", 1));
    registry.Add(new_cloud);

    EXPECT_TRUE(old_cloud->Disposed());
    EXPECT_FALSE(new_cloud->Disposed());
    EXPECT_EQ(registry.Size(), 2);
    EXPECT_EQ(registry.Find("scan"), new_cloud);
    EXPECT_EQ(registry.Active(), new_cloud);
}

TEST(CloudRegistryTest, AddingSameCloudTwiceKeepsIt) {
    CloudRegistry registry;
    auto cloud = MakeCloud("scan", 2);
    registry.Add(cloud);
    registry.Add(cloud);

    EXPECT_FALSE(cloud->Disposed());
    EXPECT_EQ(registry.Size(), 1);
}

TEST(CloudRegistryTest, RemoveDisposesAndMovesActive) {
    CloudRegistry registry;
    auto first = MakeCloud("first", 1);
    auto second = MakeCloud("second", 1);
    registry.Add(first);
    registry.Add(second);

    EXPECT_TRUE(registry.Remove("second"));
    EXPECT_TRUE(second->Disposed());
    EXPECT_EQ(registry.Active(), first);
    EXPECT_FALSE(registry.Remove("second"));

    EXPECT_TRUE(registry.Remove("first"));
    EXPECT_EQ(registry.Active(), nullptr);
}

TEST(CloudRegistryTest, NamesAreSorted) {
    CloudRegistry registry;
    registry.Add(MakeCloud("zeta", 1));
    registry.Add(MakeCloud("alpha", 1));
    registry.Add(MakeCloud("mid", 1));

    EXPECT_EQ(registry.Names(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST(CloudRegistryTest, ClearDisposesAll) {
    CloudRegistry registry;
    auto a = MakeCloud("a", 2);
    auto b = MakeCloud("b", 2);
    registry.Add(a);
    registry.Add(b);
    registry.Clear();

    EXPECT_TRUE(a->Disposed());
    EXPECT_TRUE(b->Disposed());
    EXPECT_EQ(registry.Size(), 0);
    EXPECT_EQ(registry.TotalPoints(), 0);
    EXPECT_EQ(registry.Active(), nullptr);
}

TEST(CloudRegistryTest, NullCloudIsRejected) {
    CloudRegistry registry;
    EXPECT_THROW(registry.Add(nullptr), std::invalid_argument);
}

}  // namespace
