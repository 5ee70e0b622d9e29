#include "pcimport/config.hpp"

#include <charconv>
#include <utility>

namespace pcimport {

long ParsePositive(const std::string& text, long fallback) {
    long value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value <= 0)
        return fallback;
    return value;
}

ImportConfig ImportConfig::FromArguments(const std::unordered_map<std::string, std::string>& arguments) {
    ImportConfig config;
    auto lookup = [&](const std::string& key, long fallback) -> long {
        auto it = arguments.find(key);
        return it == arguments.end() ? fallback : ParsePositive(it->second, fallback);
    };

    if (arguments.count("file"))
        config.file = arguments.at("file");
    config.chunk_capacity = lookup("chunk_capacity", kDefaultChunkCapacity);
    config.yield_interval = lookup("yield_interval", kDefaultYieldInterval);
    config.import_step = lookup("import_step", kDefaultImportStep);
    config.batch_size = lookup("batch_size", kDefaultBatchSize);
    config.bench_points = lookup("points", kDefaultBenchPoints);
    config.verbose = arguments.count("verbose") > 0;
    return config;
}

ContainerOptions ImportConfig::ToContainerOptions(std::function<void()> yielder) const {
    ContainerOptions options;
    options.chunk_capacity = chunk_capacity;
    options.yield_interval = yield_interval;
    options.yielder = std::move(yielder);
    return options.Normalized();
}

}  // namespace pcimport
