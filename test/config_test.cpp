#include "pcimport/config.hpp"

#include <string>
#include <unordered_map>

#include "gtest/gtest.h"

using namespace pcimport;

namespace {

TEST(ConfigTest, ParsePositive) {
    EXPECT_EQ(ParsePositive("42", 7), 42);
    EXPECT_EQ(ParsePositive("0", 7), 7);
    EXPECT_EQ(ParsePositive("-3", 7), 7);
    EXPECT_EQ(ParsePositive("12abc", 7), 7);
    EXPECT_EQ(ParsePositive("", 7), 7);
    EXPECT_EQ(ParsePositive("99999999999999999999999", 7), 7);
}

TEST(ConfigTest, DefaultsWithoutArguments) {
    ImportConfig config = ImportConfig::FromArguments({});

    EXPECT_TRUE(config.file.empty());
    EXPECT_EQ(config.chunk_capacity, kDefaultChunkCapacity);
    EXPECT_EQ(config.yield_interval, kDefaultYieldInterval);
    EXPECT_EQ(config.import_step, 1);
    EXPECT_EQ(config.batch_size, 100000);
    EXPECT_EQ(config.bench_points, 1000000);
    EXPECT_FALSE(config.verbose);
}

TEST(ConfigTest, ReadsParsedArguments) {
    std::unordered_map<std::string, std::string> arguments = {
        {"file", "scan.ply"}, {"chunk_capacity", "512"}, {"yield_interval", "64"}, {"import_step", "4"},
        {"batch_size", "1000"}, {"points", "20"},         {"verbose", ""},
    };
    ImportConfig config = ImportConfig::FromArguments(arguments);

    EXPECT_EQ(config.file, "scan.ply");
    EXPECT_EQ(config.chunk_capacity, 512);
    EXPECT_EQ(config.yield_interval, 64);
    EXPECT_EQ(config.import_step, 4);
    EXPECT_EQ(config.batch_size, 1000);
    EXPECT_EQ(config.bench_points, 20);
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
    ImportConfig config = ImportConfig::FromArguments({{"chunk_capacity", "0"}, {"import_step", "two"}});

    EXPECT_EQ(config.chunk_capacity, kDefaultChunkCapacity);
    EXPECT_EQ(config.import_step, 1);
}

TEST(ConfigTest, ContainerOptionsCarryYielder) {
    ImportConfig config;
    config.chunk_capacity = -8;
    config.yield_interval = 0;
    int calls = 0;
    ContainerOptions options = config.ToContainerOptions([&calls]() { ++calls; });

    EXPECT_EQ(options.chunk_capacity, 1);
    EXPECT_EQ(options.yield_interval, kDefaultYieldInterval);
    ASSERT_TRUE(static_cast<bool>(options.yielder));
    options.yielder();
    EXPECT_EQ(calls, 1);
}

}  // namespace
