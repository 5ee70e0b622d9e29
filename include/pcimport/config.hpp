#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <functional>
#include <string>
#include <unordered_map>

#include "pcimport/utils/chunked_container.hpp"

namespace pcimport {

struct ImportConfig {
    static constexpr long kDefaultImportStep = 1;
    static constexpr long kDefaultBatchSize = 100000;
    static constexpr long kDefaultBenchPoints = 1000000;

    std::string file;
    long chunk_capacity = kDefaultChunkCapacity;
    long yield_interval = kDefaultYieldInterval;
    long import_step = kDefaultImportStep;
    long batch_size = kDefaultBatchSize;
    long bench_points = kDefaultBenchPoints;
    bool verbose = false;

    // Keys are the ones ArgsParser produces. Values that are not positive
    // integers keep their defaults.
    static ImportConfig FromArguments(const std::unordered_map<std::string, std::string>& arguments);

    ContainerOptions ToContainerOptions(std::function<void()> yielder = {}) const;
};

// Parsed value when text is a positive integer, fallback otherwise.
long ParsePositive(const std::string& text, long fallback);

}  // namespace pcimport

#endif
