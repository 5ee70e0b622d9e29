#include <pcimport/pcimport.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

#include "pcimport/io/ply_parser.hpp"

namespace pcimport {

namespace {

using Clock = std::chrono::high_resolution_clock;

double ElapsedMs(Clock::time_point beg) {
    std::chrono::duration<double, std::milli> diff = Clock::now() - beg;
    return diff.count();
}

Point3f SyntheticPoint(size_t i) {
    return {static_cast<float>(i % 1000), static_cast<float>((i / 1000) % 1000), static_cast<float>(i / 1000000)};
}

}  // namespace

std::shared_ptr<PointCloud> Importer::Import(const ImportConfig& config, CooperativeScheduler& scheduler) {
    auto beg = Clock::now();

    std::string name = std::filesystem::path(config.file).stem().string();
    auto cloud = std::make_shared<PointCloud>(name, config.ToContainerOptions(scheduler.Yielder()));

    PlyParser parser(config.file, config.import_step, config.batch_size);
    if (config.verbose) {
        // progress lines are printed from the scheduler, between container work units
        parser.SetProgressCallback([&scheduler](double fraction, size_t current, size_t total) {
            scheduler.Post("progress", [fraction, current, total]() {
                std::cout << "read " << current << "/" << total << " (" << static_cast<int>(fraction * 100) << "%)"
                          << std::endl;
            });
        });
    }

    size_t batches = 0;
    size_t points = parser.Parse([&](PlyParser::Batch&& batch) {
        cloud->AppendBatch(std::move(batch.points), std::move(batch.colors));
        ++batches;
    });
    cloud->SetMetadata(parser.header().comments);
    cloud->Finalize();
    scheduler.RunPending(scheduler.Pending());
    // the returned cloud may outlive the scheduler
    cloud->SetYielder({});

    if (parser.truncated())
        std::cerr << config.file << ": expected " << parser.header().vertex_count << " vertices, read "
                  << parser.vertices_read() << "." << std::endl;

    const auto& bounds = cloud->Bounds();
    std::cout << "cloud " << cloud->name() << ": " << points << " point(s) in " << cloud->ChunkCount()
              << " chunk(s), " << batches << " batch(es)" << (cloud->HasColors() ? ", with colors" : "") << "."
              << std::endl;
    if (!bounds.Empty()) {
        std::cout << "bounds min (" << bounds.min().x << ", " << bounds.min().y << ", " << bounds.min().z << ") max ("
                  << bounds.max().x << ", " << bounds.max().y << ", " << bounds.max().z << ")" << std::endl;
    }
    std::cout << "import " << config.file << " takes " << ElapsedMs(beg) << " ms." << std::endl;
    return cloud;
}

bool Importer::Bench(const ImportConfig& config, CooperativeScheduler& scheduler) {
    const size_t total = static_cast<size_t>(config.bench_points);
    const size_t batch_size = static_cast<size_t>(config.batch_size);
    ContainerOptions options = config.ToContainerOptions(scheduler.Yielder());

    ChunkedContainer<Point3f> bulk(options);
    size_t yields = scheduler.YieldCount();
    auto beg = Clock::now();
    for (size_t start = 0; start < total; start += batch_size) {
        size_t end = std::min(total, start + batch_size);
        std::vector<Point3f> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; i++)
            batch.push_back(SyntheticPoint(i));
        bulk.AppendBatch(std::move(batch));
    }
    std::cout << "bulk append of " << bulk.size() << " point(s) into " << bulk.ChunkCount() << " chunk(s) takes "
              << ElapsedMs(beg) << " ms, " << scheduler.YieldCount() - yields << " yield(s)." << std::endl;

    ChunkedContainer<Point3f> incremental(options);
    beg = Clock::now();
    for (size_t i = 0; i < total; i++)
        incremental.AppendOne(SyntheticPoint(i));
    incremental.TrimLastChunk();
    std::cout << "incremental append of " << incremental.size() << " point(s) into " << incremental.ChunkCount()
              << " chunk(s) takes " << ElapsedMs(beg) << " ms." << std::endl;

    if (incremental.size() != bulk.size()) {
        std::cerr << "bench: bulk holds " << bulk.size() << " point(s), incremental " << incremental.size() << "."
                  << std::endl;
        return false;
    }

    yields = scheduler.YieldCount();
    beg = Clock::now();
    size_t mismatches = 0;
    size_t index = 0;
    auto other = incremental.begin();
    for (const auto& point : bulk.EachYielding()) {
        if (!(point == *other) || !(point == SyntheticPoint(index)))
            ++mismatches;
        ++other;
        ++index;
    }
    std::cout << "yielding scan of " << index << " point(s) takes " << ElapsedMs(beg) << " ms, "
              << scheduler.YieldCount() - yields << " yield(s)." << std::endl;

    if (mismatches != 0 || index != total) {
        std::cerr << "bench: " << mismatches << " mismatched point(s), scanned " << index << " of " << total << "."
                  << std::endl;
        return false;
    }
    return true;
}

}  // namespace pcimport
