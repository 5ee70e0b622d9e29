#include "pcimport/cloud/cloud_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pcimport {

void CloudRegistry::Add(std::shared_ptr<PointCloud> cloud) {
    if (!cloud)
        throw std::invalid_argument("Cannot register a null point cloud.");

    std::shared_ptr<PointCloud> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = clouds_[cloud->name()];
        replaced = std::move(slot);
        slot = cloud;
        order_.erase(std::remove(order_.begin(), order_.end(), cloud->name()), order_.end());
        order_.push_back(cloud->name());
    }

    // dispose outside the lock, it may release millions of points
    if (replaced && replaced != cloud)
        replaced->Dispose();
}

bool CloudRegistry::Remove(const std::string& name) {
    std::shared_ptr<PointCloud> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clouds_.find(name);
        if (it == clouds_.end())
            return false;
        removed = std::move(it->second);
        clouds_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    }

    removed->Dispose();
    return true;
}

std::shared_ptr<PointCloud> CloudRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clouds_.find(name);
    return it == clouds_.end() ? nullptr : it->second;
}

std::shared_ptr<PointCloud> CloudRegistry::Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (order_.empty())
        return nullptr;
    return clouds_.at(order_.back());
}

std::vector<std::string> CloudRegistry::Names() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(clouds_.size());
        for (const auto& [name, _] : clouds_)
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void CloudRegistry::Clear() {
    std::vector<std::shared_ptr<PointCloud>> disposing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disposing.reserve(clouds_.size());
        for (auto& [_, cloud] : clouds_)
            disposing.push_back(std::move(cloud));
        clouds_.clear();
        order_.clear();
    }

    for (auto& cloud : disposing)
        cloud->Dispose();
}

size_t CloudRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clouds_.size();
}

size_t CloudRegistry::TotalPoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [_, cloud] : clouds_)
        total += cloud->Size();
    return total;
}

}  // namespace pcimport
