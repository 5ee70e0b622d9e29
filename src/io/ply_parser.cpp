#include "pcimport/io/ply_parser.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace pcimport {

namespace {

std::string Trim(const std::string& line) {
    size_t begin = line.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    size_t end = line.find_last_not_of(" \t\r\n");
    return line.substr(begin, end - begin + 1);
}

template <typename V>
double ReadLittleEndian(const char* src) {
    char bytes[sizeof(V)];
    std::memcpy(bytes, src, sizeof(V));
    if constexpr (std::endian::native == std::endian::big)
        std::reverse(bytes, bytes + sizeof(V));
    V value;
    std::memcpy(&value, bytes, sizeof(V));
    return static_cast<double>(value);
}

uint8_t ToChannel(double value) {
    long channel = std::lround(value);
    return static_cast<uint8_t>(std::clamp(channel, 0L, 255L));
}

}  // namespace

PlyParser::PlyParser(std::string path, long import_step, long batch_size)
    : path_(std::move(path)),
      import_step_(import_step < 1 ? 1 : static_cast<size_t>(import_step)),
      batch_size_(batch_size < 1 ? kDefaultBatchSize : static_cast<size_t>(batch_size)) {}

size_t PlyParser::Parse(const BatchCallback& on_batch) {
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("Cannot open " + path_ + ".");
    return Parse(in, on_batch);
}

size_t PlyParser::Parse(std::istream& in, const BatchCallback& on_batch) {
    header_ = Header();
    layout_ = Layout();
    vertices_read_ = 0;

    ParseHeader(in);
    if (header_.format == Format::kAscii)
        return ParseAscii(in, on_batch);
    return ParseBinary(in, on_batch);
}

PlyParser::ScalarType PlyParser::ParseScalarType(const std::string& name) {
    if (name == "char" || name == "int8")
        return ScalarType::kInt8;
    if (name == "uchar" || name == "uint8")
        return ScalarType::kUInt8;
    if (name == "short" || name == "int16")
        return ScalarType::kInt16;
    if (name == "ushort" || name == "uint16")
        return ScalarType::kUInt16;
    if (name == "int" || name == "int32")
        return ScalarType::kInt32;
    if (name == "uint" || name == "uint32")
        return ScalarType::kUInt32;
    if (name == "float" || name == "float32")
        return ScalarType::kFloat32;
    if (name == "double" || name == "float64")
        return ScalarType::kFloat64;
    throw UnsupportedFormat("Unknown property type " + name + ".");
}

size_t PlyParser::ScalarSize(ScalarType type) {
    switch (type) {
        case ScalarType::kInt8:
        case ScalarType::kUInt8:
            return 1;
        case ScalarType::kInt16:
        case ScalarType::kUInt16:
            return 2;
        case ScalarType::kInt32:
        case ScalarType::kUInt32:
        case ScalarType::kFloat32:
            return 4;
        case ScalarType::kFloat64:
            return 8;
    }
    return 0;
}

void PlyParser::ParseHeader(std::istream& in) {
    std::string line;
    if (!std::getline(in, line) || Trim(line) != "ply")
        throw UnsupportedFormat("Not a PLY file.");

    bool format_seen = false;
    bool header_ended = false;
    bool in_vertex = false;
    bool vertex_seen = false;
    bool data_before_vertex = false;

    while (std::getline(in, line)) {
        std::istringstream tokens(Trim(line));
        std::string keyword;
        tokens >> keyword;
        if (keyword.empty())
            continue;

        if (keyword == "format") {
            std::string format;
            tokens >> format;
            if (format == "ascii")
                header_.format = Format::kAscii;
            else if (format == "binary_little_endian")
                header_.format = Format::kBinaryLittleEndian;
            else
                throw UnsupportedFormat("Only ascii and binary_little_endian PLY are supported, got " + format + ".");
            format_seen = true;
        } else if (keyword == "comment" || keyword == "obj_info") {
            std::string text;
            std::getline(tokens >> std::ws, text);
            header_.comments.push_back(text);
        } else if (keyword == "element") {
            std::string name;
            size_t count = 0;
            tokens >> name >> count;
            in_vertex = name == "vertex";
            if (in_vertex) {
                header_.vertex_count = count;
                vertex_seen = true;
            } else if (!vertex_seen && count > 0) {
                data_before_vertex = true;
            }
        } else if (keyword == "property") {
            if (!in_vertex)
                continue;
            std::string type;
            std::string name;
            tokens >> type;
            if (type == "list")
                throw UnsupportedFormat("List properties on vertex are not supported.");
            tokens >> name;
            ScalarType scalar = ParseScalarType(type);
            header_.properties.push_back({name, scalar, ScalarSize(scalar)});
        } else if (keyword == "end_header") {
            header_ended = true;
            break;
        }
    }

    if (!header_ended)
        throw UnsupportedFormat("Missing end_header.");
    if (!format_seen)
        throw UnsupportedFormat("Missing format line.");
    if (vertex_seen && data_before_vertex)
        throw UnsupportedFormat("Vertex element must be the first element.");

    for (size_t i = 0; i < header_.properties.size(); i++) {
        const auto& property = header_.properties[i];
        int position = static_cast<int>(i);
        header_.stride += property.size;
        if (property.name == "x")
            layout_.x = position;
        else if (property.name == "y")
            layout_.y = position;
        else if (property.name == "z")
            layout_.z = position;
        else if (property.name == "red" || property.name == "r")
            layout_.red = position;
        else if (property.name == "green" || property.name == "g")
            layout_.green = position;
        else if (property.name == "blue" || property.name == "b")
            layout_.blue = position;
    }

    if (header_.vertex_count > 0 && (layout_.x < 0 || layout_.y < 0 || layout_.z < 0))
        throw UnsupportedFormat("Vertex element lacks x, y or z.");
    header_.has_color = layout_.red >= 0 && layout_.green >= 0 && layout_.blue >= 0;
}

size_t PlyParser::ParseAscii(std::istream& in, const BatchCallback& on_batch) {
    Batch batch;
    size_t emitted = 0;
    std::vector<double> values(header_.properties.size());
    std::string line;

    for (size_t index = 0; index < header_.vertex_count; index++) {
        if (!std::getline(in, line))
            break;
        ++vertices_read_;
        Report(index);
        if (index % import_step_ != 0)
            continue;

        std::istringstream tokens(line);
        bool complete = true;
        for (auto& value : values) {
            if (!(tokens >> value)) {
                complete = false;
                break;
            }
        }
        if (!complete) {
            // a file cut off inside its last vertex line is truncated, not malformed
            if (in.eof()) {
                --vertices_read_;
                break;
            }
            throw UnsupportedFormat("Malformed vertex " + std::to_string(index) + ".");
        }
        Accept(values, batch, on_batch, emitted);
    }

    Flush(batch, on_batch);
    return emitted;
}

size_t PlyParser::ParseBinary(std::istream& in, const BatchCallback& on_batch) {
    Batch batch;
    size_t emitted = 0;
    std::vector<double> values(header_.properties.size());
    std::vector<char> record(header_.stride);
    const auto stride = static_cast<std::streamsize>(header_.stride);

    for (size_t index = 0; index < header_.vertex_count; index++) {
        in.read(record.data(), stride);
        if (in.gcount() != stride)
            break;
        ++vertices_read_;
        Report(index);
        if (index % import_step_ != 0)
            continue;

        DecodeBinary(record.data(), values);
        Accept(values, batch, on_batch, emitted);
    }

    Flush(batch, on_batch);
    return emitted;
}

void PlyParser::DecodeBinary(const char* record, std::vector<double>& values) const {
    size_t pointer = 0;
    for (size_t i = 0; i < header_.properties.size(); i++) {
        const auto& property = header_.properties[i];
        const char* src = record + pointer;
        switch (property.type) {
            case ScalarType::kInt8:
                values[i] = ReadLittleEndian<int8_t>(src);
                break;
            case ScalarType::kUInt8:
                values[i] = ReadLittleEndian<uint8_t>(src);
                break;
            case ScalarType::kInt16:
                values[i] = ReadLittleEndian<int16_t>(src);
                break;
            case ScalarType::kUInt16:
                values[i] = ReadLittleEndian<uint16_t>(src);
                break;
            case ScalarType::kInt32:
                values[i] = ReadLittleEndian<int32_t>(src);
                break;
            case ScalarType::kUInt32:
                values[i] = ReadLittleEndian<uint32_t>(src);
                break;
            case ScalarType::kFloat32:
                values[i] = ReadLittleEndian<float>(src);
                break;
            case ScalarType::kFloat64:
                values[i] = ReadLittleEndian<double>(src);
                break;
        }
        pointer += property.size;
    }
}

void PlyParser::Accept(const std::vector<double>& values,
                       Batch& batch,
                       const BatchCallback& on_batch,
                       size_t& emitted) {
    batch.points.push_back({static_cast<float>(values[layout_.x]), static_cast<float>(values[layout_.y]),
                            static_cast<float>(values[layout_.z])});
    if (header_.has_color)
        batch.colors.push_back({ToChannel(values[layout_.red]), ToChannel(values[layout_.green]),
                                ToChannel(values[layout_.blue])});
    ++emitted;

    if (batch.points.size() >= batch_size_)
        Flush(batch, on_batch);
}

void PlyParser::Flush(Batch& batch, const BatchCallback& on_batch) {
    if (batch.points.empty())
        return;
    if (on_batch)
        on_batch(std::move(batch));
    batch = Batch();
}

void PlyParser::Report(size_t current) {
    size_t total = header_.vertex_count;
    if (!progress_callback_ || total == 0)
        return;

    size_t step = std::max<size_t>(total / 100, 1);
    if (current % step != 0 && current != total - 1)
        return;

    double fraction = static_cast<double>(current) / static_cast<double>(std::max<size_t>(total - 1, 1));
    progress_callback_(fraction, current + 1, total);
}

}  // namespace pcimport
