#ifndef PLY_PARSER_HPP
#define PLY_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "pcimport/cloud/point.hpp"

namespace pcimport {

// Reads the vertex element of ASCII or binary little endian PLY files and
// hands the points over in batches sized for ChunkedContainer::AppendBatch.
class PlyParser {
   public:
    class UnsupportedFormat : public std::runtime_error {
       public:
        using std::runtime_error::runtime_error;
    };

    enum class Format {
        kAscii,
        kBinaryLittleEndian,
    };

    enum class ScalarType {
        kInt8,
        kUInt8,
        kInt16,
        kUInt16,
        kInt32,
        kUInt32,
        kFloat32,
        kFloat64,
    };

    struct Property {
        std::string name;
        ScalarType type;
        size_t size;
    };

    struct Header {
        Format format = Format::kAscii;
        size_t vertex_count = 0;
        std::vector<Property> properties;
        std::vector<std::string> comments;
        // byte size of one binary vertex record
        size_t stride = 0;
        bool has_color = false;
    };

    struct Batch {
        std::vector<Point3f> points;
        // empty when the file carries no color
        std::vector<Color> colors;
    };

    using BatchCallback = std::function<void(Batch&&)>;
    using ProgressCallback = std::function<void(double fraction, size_t current, size_t total)>;

    static constexpr size_t kDefaultBatchSize = 100000;

    explicit PlyParser(std::string path, long import_step = 1, long batch_size = kDefaultBatchSize);

    void SetProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Parses the file at path(). Returns the number of points delivered.
    size_t Parse(const BatchCallback& on_batch);

    size_t Parse(std::istream& in, const BatchCallback& on_batch);

    static ScalarType ParseScalarType(const std::string& name);

    static size_t ScalarSize(ScalarType type);

    const std::string& path() const { return path_; }

    const Header& header() const { return header_; }

    size_t import_step() const { return import_step_; }

    size_t batch_size() const { return batch_size_; }

    size_t vertices_read() const { return vertices_read_; }

    bool truncated() const { return vertices_read_ < header_.vertex_count; }

   private:
    struct Layout {
        int x = -1;
        int y = -1;
        int z = -1;
        int red = -1;
        int green = -1;
        int blue = -1;
    };

    void ParseHeader(std::istream& in);

    size_t ParseAscii(std::istream& in, const BatchCallback& on_batch);

    size_t ParseBinary(std::istream& in, const BatchCallback& on_batch);

    void DecodeBinary(const char* record, std::vector<double>& values) const;

    void Accept(const std::vector<double>& values, Batch& batch, const BatchCallback& on_batch, size_t& emitted);

    void Flush(Batch& batch, const BatchCallback& on_batch);

    void Report(size_t current);

    std::string path_;
    size_t import_step_;
    size_t batch_size_;
    ProgressCallback progress_callback_;

    Header header_;
    Layout layout_;
    size_t vertices_read_ = 0;
};

}  // namespace pcimport

#endif
