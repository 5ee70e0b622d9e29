#include "exec/args_parser.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "pcimport/config.hpp"

namespace {

ArgsParser::CommandT ParseLine(ArgsParser& parser, std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& word : words)
        argv.push_back(word.data());
    return parser.Parse(static_cast<int>(argv.size()), argv.data());
}

TEST(ArgsParserTest, ImportCollectsOptions) {
    ArgsParser parser;
    auto command = ParseLine(parser, {"pcimport", "import", "-f", "scan.ply", "--chunk-capacity", "512", "-v"});

    EXPECT_EQ(command, ArgsParser::CommandT::kImport);
    const auto& arguments = parser.Arguments();
    EXPECT_EQ(arguments.at("file"), "scan.ply");
    EXPECT_EQ(arguments.at("chunk_capacity"), "512");
    EXPECT_TRUE(arguments.count("verbose"));
}

TEST(ArgsParserTest, NonAsciiValueFallsBackToDefault) {
    ArgsParser parser;
    auto command = ParseLine(parser, {"pcimport", "bench", "-c", "\xC3\xA9\xFF", "-n", "12\xE2\x82\xAC"});

    EXPECT_EQ(command, ArgsParser::CommandT::kBench);
    auto config = pcimport::ImportConfig::FromArguments(parser.Arguments());
    EXPECT_EQ(config.chunk_capacity, pcimport::kDefaultChunkCapacity);
    EXPECT_EQ(config.bench_points, pcimport::ImportConfig::kDefaultBenchPoints);
}

}  // namespace
