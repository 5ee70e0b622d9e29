#include "pcimport/cloud/point_cloud.hpp"

#include <stdexcept>
#include <utility>

namespace pcimport {

PointCloud::PointCloud(std::string name, const ContainerOptions& options)
    : name_(std::move(name)), options_(options.Normalized()), points_(options_), colors_(options_) {}

void PointCloud::AppendBatch(std::vector<Point3f>&& points, std::vector<Color>&& colors) {
    if (disposed_)
        throw std::logic_error("Point cloud " + name_ + " is disposed.");
    if (points.empty())
        return;
    if (!colors.empty() && colors.size() != points.size())
        throw std::invalid_argument("Color batch size " + std::to_string(colors.size()) +
                                    " does not match point batch size " + std::to_string(points.size()) + ".");
    CheckColorPresence(!colors.empty());

    for (const auto& p : points)
        bounds_.Add(p);

    points_.AppendBatch(std::move(points));
    if (!colors.empty())
        colors_.AppendBatch(std::move(colors));
}

const Point3f& PointCloud::AppendPoint(const Point3f& point) {
    if (disposed_)
        throw std::logic_error("Point cloud " + name_ + " is disposed.");
    CheckColorPresence(false);
    bounds_.Add(point);
    return points_.AppendOne(point);
}

const Point3f& PointCloud::AppendPoint(const Point3f& point, const Color& color) {
    if (disposed_)
        throw std::logic_error("Point cloud " + name_ + " is disposed.");
    CheckColorPresence(true);
    bounds_.Add(point);
    colors_.AppendOne(color);
    return points_.AppendOne(point);
}

void PointCloud::Finalize() {
    points_.TrimLastChunk();
    colors_.TrimLastChunk();
}

std::shared_ptr<PointCloud> PointCloud::Decimate(const std::string& name, long step) const {
    size_t keep_every = step < 1 ? 1 : static_cast<size_t>(step);
    auto sampled = std::make_shared<PointCloud>(name, options_);
    sampled->SetMetadata(metadata_);

    size_t index = 0;
    for (const auto& point : points_.EachYielding()) {
        if (index % keep_every == 0) {
            if (HasColors())
                sampled->AppendPoint(point, colors_.At(static_cast<std::ptrdiff_t>(index)));
            else
                sampled->AppendPoint(point);
        }
        ++index;
    }
    sampled->Finalize();
    return sampled;
}

void PointCloud::SetYielder(std::function<void()> yielder) {
    options_.yielder = std::move(yielder);
    points_.SetYielder(options_.yielder);
    colors_.SetYielder(options_.yielder);
}

void PointCloud::Dispose() {
    points_.Clear();
    colors_.Clear();
    metadata_.clear();
    bounds_.Reset();
    disposed_ = true;
}

void PointCloud::CheckColorPresence(bool with_color) const {
    if (points_.empty())
        return;
    if (with_color != HasColors())
        throw std::invalid_argument("Point cloud " + name_ + (HasColors() ? " requires" : " has no") + " colors.");
}

}  // namespace pcimport
