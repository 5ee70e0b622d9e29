#ifndef POINT_HPP
#define POINT_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace pcimport {

struct Point3f {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    bool operator==(const Point3f& other) const = default;
};

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& other) const = default;
};

class BoundingBox {
   public:
    void Add(const Point3f& p) {
        min_.x = std::min(min_.x, p.x);
        min_.y = std::min(min_.y, p.y);
        min_.z = std::min(min_.z, p.z);
        max_.x = std::max(max_.x, p.x);
        max_.y = std::max(max_.y, p.y);
        max_.z = std::max(max_.z, p.z);
    }

    void Reset() { *this = BoundingBox(); }

    bool Empty() const { return min_.x > max_.x; }

    const Point3f& min() const { return min_; }

    const Point3f& max() const { return max_; }

    Point3f Center() const {
        if (Empty())
            return {};
        return {(min_.x + max_.x) / 2, (min_.y + max_.y) / 2, (min_.z + max_.z) / 2};
    }

    double Diagonal() const {
        if (Empty())
            return 0.0;
        double dx = max_.x - min_.x;
        double dy = max_.y - min_.y;
        double dz = max_.z - min_.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

   private:
    static constexpr float kInf = std::numeric_limits<float>::infinity();

    Point3f min_{kInf, kInf, kInf};
    Point3f max_{-kInf, -kInf, -kInf};
};

}  // namespace pcimport

#endif
