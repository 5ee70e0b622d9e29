#ifndef CLOUD_REGISTRY_HPP
#define CLOUD_REGISTRY_HPP

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pcimport/cloud/point_cloud.hpp"

namespace pcimport {

// Loaded clouds by name. One mutex guards the whole registry; the clouds
// themselves are not synchronized.
class CloudRegistry {
   public:
    CloudRegistry() = default;

    CloudRegistry(const CloudRegistry&) = delete;
    CloudRegistry& operator=(const CloudRegistry&) = delete;

    // Replaces and disposes a cloud of the same name. The added cloud
    // becomes the active one.
    void Add(std::shared_ptr<PointCloud> cloud);

    bool Remove(const std::string& name);

    std::shared_ptr<PointCloud> Find(const std::string& name) const;

    std::shared_ptr<PointCloud> Active() const;

    std::vector<std::string> Names() const;

    void Clear();

    size_t Size() const;

    size_t TotalPoints() const;

   private:
    mutable std::mutex mutex_;
    phmap::flat_hash_map<std::string, std::shared_ptr<PointCloud>> clouds_;
    // registration order, the last one is active
    std::vector<std::string> order_;
};

}  // namespace pcimport

#endif
