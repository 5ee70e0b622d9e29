#ifndef PCIMPORT_HPP
#define PCIMPORT_HPP

#include <memory>

#include "pcimport/cloud/point_cloud.hpp"
#include "pcimport/config.hpp"
#include "pcimport/utils/cooperative_scheduler.hpp"

namespace pcimport {

class Importer {
   public:
    Importer() = delete;

    ~Importer() = delete;

    // Parses config.file into a finalized cloud named after the file stem.
    // The scheduler only serves the import; the returned cloud holds no
    // reference to it.
    static std::shared_ptr<PointCloud> Import(const ImportConfig& config, CooperativeScheduler& scheduler);

    // Fills containers through both append paths and scans them, printing timings.
    static bool Bench(const ImportConfig& config, CooperativeScheduler& scheduler);
};

}  // namespace pcimport

#endif
