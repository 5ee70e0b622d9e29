#ifndef POINT_CLOUD_HPP
#define POINT_CLOUD_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pcimport/cloud/point.hpp"
#include "pcimport/utils/chunked_container.hpp"

namespace pcimport {

// Positions, optional colors and header metadata of one imported cloud.
// Colors are all-or-nothing: either every point has one or none has.
class PointCloud {
   public:
    explicit PointCloud(std::string name, const ContainerOptions& options = ContainerOptions());

    // Bulk path. The vectors are adopted by the containers.
    void AppendBatch(std::vector<Point3f>&& points, std::vector<Color>&& colors = {});

    // Incremental path.
    const Point3f& AppendPoint(const Point3f& point);

    const Point3f& AppendPoint(const Point3f& point, const Color& color);

    // Seals both containers once producers are done.
    void Finalize();

    // Keeps every step-th point, refilling through the incremental path.
    std::shared_ptr<PointCloud> Decimate(const std::string& name, long step) const;

    void Dispose();

    // Replaces the yield callback of both containers and of clouds derived
    // by Decimate. An empty callback detaches the cloud from its scheduler.
    void SetYielder(std::function<void()> yielder);

    const Point3f& Point(std::ptrdiff_t index) const { return points_.At(index); }

    std::optional<Color> ColorAt(std::ptrdiff_t index) const { return colors_.Get(index); }

    const std::string& name() const { return name_; }

    size_t Size() const { return points_.size(); }

    bool HasColors() const { return !colors_.empty(); }

    bool Disposed() const { return disposed_; }

    const BoundingBox& Bounds() const { return bounds_; }

    size_t ChunkCount() const { return points_.ChunkCount(); }

    const ChunkedContainer<Point3f>& points() const { return points_; }

    const ChunkedContainer<Color>& colors() const { return colors_; }

    const std::vector<std::string>& metadata() const { return metadata_; }

    void SetMetadata(std::vector<std::string> metadata) { metadata_ = std::move(metadata); }

   private:
    void CheckColorPresence(bool with_color) const;

    std::string name_;
    ContainerOptions options_;
    ChunkedContainer<Point3f> points_;
    ChunkedContainer<Color> colors_;
    std::vector<std::string> metadata_;
    BoundingBox bounds_;
    bool disposed_ = false;
};

}  // namespace pcimport

#endif
