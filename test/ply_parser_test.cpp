#include "pcimport/io/ply_parser.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

using namespace pcimport;

namespace {

std::string AsciiCloud(size_t count, bool with_color) {
    std::ostringstream out;
    out << "ply\n"
        << "format ascii 1.0\n"
        << "comment made by hand\n"
        << "element vertex " << count << "\n"
        << "property float x\n"
        << "property float y\n"
        << "property float z\n";
    if (with_color)
        out << "property uchar red\nproperty uchar green\nproperty uchar blue\n";
    out << "element face 0\n"
        << "property list uchar int vertex_indices\n"
        << "end_header\n";
    for (size_t i = 0; i < count; i++) {
        out << i << " " << i * 2 << " " << i * 3;
        if (with_color)
            out << " " << i % 256 << " 10 20";
        out << "\n";
    }
    return out.str();
}

template <typename V>
void PutLittleEndian(std::string& out, V value) {
    char bytes[sizeof(V)];
    std::memcpy(bytes, &value, sizeof(V));
    if constexpr (std::endian::native == std::endian::big)
        std::reverse(bytes, bytes + sizeof(V));
    out.append(bytes, sizeof(V));
}

std::vector<PlyParser::Batch> ParseAll(PlyParser& parser, const std::string& text, size_t* delivered = nullptr) {
    std::istringstream in(text);
    std::vector<PlyParser::Batch> batches;
    size_t count = parser.Parse(in, [&](PlyParser::Batch&& batch) { batches.push_back(std::move(batch)); });
    if (delivered)
        *delivered = count;
    return batches;
}

TEST(PlyParserTest, ReadsAsciiVertices) {
    PlyParser parser("memory.ply");
    size_t delivered = 0;
    auto batches = ParseAll(parser, AsciiCloud(4, false), &delivered);

    EXPECT_EQ(delivered, 4);
    ASSERT_EQ(batches.size(), 1);
    ASSERT_EQ(batches[0].points.size(), 4);
    EXPECT_TRUE(batches[0].colors.empty());
    EXPECT_EQ(batches[0].points[3], (Point3f{3, 6, 9}));
    EXPECT_FALSE(parser.header().has_color);
    EXPECT_EQ(parser.header().format, PlyParser::Format::kAscii);
    ASSERT_EQ(parser.header().comments.size(), 1);
    EXPECT_EQ(parser.header().comments[0], "made by hand");
    EXPECT_FALSE(parser.truncated());
}

TEST(PlyParserTest, ReadsAsciiColors) {
    PlyParser parser("memory.ply");
    auto batches = ParseAll(parser, AsciiCloud(3, true));

    ASSERT_EQ(batches.size(), 1);
    ASSERT_EQ(batches[0].colors.size(), 3);
    EXPECT_EQ(batches[0].colors[2], (Color{2, 10, 20}));
    EXPECT_TRUE(parser.header().has_color);
}

TEST(PlyParserTest, SplitsIntoBatches) {
    PlyParser parser("memory.ply", 1, 4);
    auto batches = ParseAll(parser, AsciiCloud(10, false));

    ASSERT_EQ(batches.size(), 3);
    EXPECT_EQ(batches[0].points.size(), 4);
    EXPECT_EQ(batches[1].points.size(), 4);
    EXPECT_EQ(batches[2].points.size(), 2);
    EXPECT_EQ(batches[2].points[1], (Point3f{9, 18, 27}));
}

TEST(PlyParserTest, ImportStepSkipsVertices) {
    PlyParser parser("memory.ply", 3);
    size_t delivered = 0;
    auto batches = ParseAll(parser, AsciiCloud(10, false), &delivered);

    EXPECT_EQ(delivered, 4);
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].points[0].x, 0);
    EXPECT_EQ(batches[0].points[1].x, 3);
    EXPECT_EQ(batches[0].points[2].x, 6);
    EXPECT_EQ(batches[0].points[3].x, 9);
    EXPECT_EQ(parser.vertices_read(), 10);
}

TEST(PlyParserTest, NonPositiveSettingsAreClamped) {
    PlyParser parser("memory.ply", 0, -5);
    EXPECT_EQ(parser.import_step(), 1);
    EXPECT_EQ(parser.batch_size(), PlyParser::kDefaultBatchSize);
}

TEST(PlyParserTest, ReadsBinaryLittleEndian) {
    std::string text =
        "ply\n"
        "format binary_little_endian 1.0\n"
        "element vertex 2\n"
        "property double x\n"
        "property float y\n"
        "property int z\n"
        "property ushort intensity\n"
        "property uchar r\n"
        "property uchar g\n"
        "property uchar b\n"
        "end_header\n";
    for (int i = 0; i < 2; i++) {
        PutLittleEndian<double>(text, 1.5 + i);
        PutLittleEndian<float>(text, -2.25f);
        PutLittleEndian<int32_t>(text, 7 * (i + 1));
        PutLittleEndian<uint16_t>(text, 1000);
        PutLittleEndian<uint8_t>(text, 255);
        PutLittleEndian<uint8_t>(text, static_cast<uint8_t>(i));
        PutLittleEndian<uint8_t>(text, 42);
    }

    PlyParser parser("memory.ply");
    auto batches = ParseAll(parser, text);

    EXPECT_EQ(parser.header().format, PlyParser::Format::kBinaryLittleEndian);
    EXPECT_EQ(parser.header().stride, 8 + 4 + 4 + 2 + 3);
    ASSERT_EQ(batches.size(), 1);
    ASSERT_EQ(batches[0].points.size(), 2);
    EXPECT_EQ(batches[0].points[0], (Point3f{1.5f, -2.25f, 7.0f}));
    EXPECT_EQ(batches[0].points[1], (Point3f{2.5f, -2.25f, 14.0f}));
    EXPECT_EQ(batches[0].colors[1], (Color{255, 1, 42}));
}

TEST(PlyParserTest, TruncatedBodyStopsEarly) {
    std::string text = AsciiCloud(5, false);
    // drop the last two vertex lines
    for (int i = 0; i < 2; i++)
        text.erase(text.find_last_of('\n', text.size() - 2) + 1);

    PlyParser parser("memory.ply");
    size_t delivered = 0;
    ParseAll(parser, text, &delivered);

    EXPECT_EQ(delivered, 3);
    EXPECT_TRUE(parser.truncated());
    EXPECT_EQ(parser.vertices_read(), 3);
}

TEST(PlyParserTest, TruncatedMidLineStopsEarly) {
    std::string text =
        "ply\nformat ascii 1.0\nelement vertex 3\n"
        "property float x\nproperty float y\nproperty float z\nend_header\n"
        "1 2 3\n4 5";
    PlyParser parser("memory.ply");
    size_t delivered = 0;
    auto batches = ParseAll(parser, text, &delivered);

    EXPECT_EQ(delivered, 1);
    ASSERT_EQ(batches.size(), 1);
    ASSERT_EQ(batches[0].points.size(), 1);
    EXPECT_EQ(batches[0].points[0], (Point3f{1, 2, 3}));
    EXPECT_TRUE(parser.truncated());
    EXPECT_EQ(parser.vertices_read(), 1);
}

TEST(PlyParserTest, RejectsMalformedAsciiVertex) {
    std::string text =
        "ply\nformat ascii 1.0\nelement vertex 1\n"
        "property float x\nproperty float y\nproperty float z\nend_header\n"
        "1 oops 3\n";
    PlyParser parser("memory.ply");
    EXPECT_THROW(ParseAll(parser, text), PlyParser::UnsupportedFormat);

    // a short line followed by more vertices is not a truncation
    std::string short_line =
        "ply\nformat ascii 1.0\nelement vertex 2\n"
        "property float x\nproperty float y\nproperty float z\nend_header\n"
        "1 2\n4 5 6\n";
    EXPECT_THROW(ParseAll(parser, short_line), PlyParser::UnsupportedFormat);
}

TEST(PlyParserTest, RejectsUnsupportedInput) {
    PlyParser parser("memory.ply");
    EXPECT_THROW(ParseAll(parser, "solid cube\n"), PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser, "ply\nformat binary_big_endian 1.0\nelement vertex 0\nend_header\n"),
                 PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser, "ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\n"),
                 PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser,
                          "ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\nproperty float y\n"
                          "end_header\n1 2\n"),
                 PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser,
                          "ply\nformat ascii 1.0\nelement vertex 1\nproperty half x\nend_header\n"),
                 PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser,
                          "ply\nformat ascii 1.0\nelement vertex 1\nproperty list uchar int x\nend_header\n"),
                 PlyParser::UnsupportedFormat);
    EXPECT_THROW(ParseAll(parser,
                          "ply\nformat ascii 1.0\nelement face 2\nproperty list uchar int vertex_indices\n"
                          "element vertex 1\nproperty float x\nproperty float y\nproperty float z\n"
                          "end_header\n"),
                 PlyParser::UnsupportedFormat);
}

TEST(PlyParserTest, UnknownScalarTypeThrows) {
    EXPECT_EQ(PlyParser::ParseScalarType("uint8"), PlyParser::ScalarType::kUInt8);
    EXPECT_EQ(PlyParser::ScalarSize(PlyParser::ScalarType::kFloat64), 8);
    EXPECT_THROW(PlyParser::ParseScalarType("quad"), PlyParser::UnsupportedFormat);
}

TEST(PlyParserTest, MissingFileThrows) {
    PlyParser parser("/nonexistent/dir/cloud.ply");
    EXPECT_THROW(parser.Parse([](PlyParser::Batch&&) {}), std::runtime_error);
}

TEST(PlyParserTest, ReportsProgressUpToCompletion) {
    PlyParser parser("memory.ply");
    std::vector<double> fractions;
    size_t last_current = 0;
    parser.SetProgressCallback([&](double fraction, size_t current, size_t total) {
        fractions.push_back(fraction);
        last_current = current;
        EXPECT_EQ(total, 250);
    });
    ParseAll(parser, AsciiCloud(250, false));

    ASSERT_FALSE(fractions.empty());
    EXPECT_LE(fractions.size(), 130);
    EXPECT_DOUBLE_EQ(fractions.front(), 0.0);
    EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
    EXPECT_EQ(last_current, 250);
}

}  // namespace
