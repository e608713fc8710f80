#pragma once

#include "speccle/platform_source.hpp"
#include "speccle/system_info.hpp"

#include <memory>
#include <string>
#include <vector>

namespace speccle {

struct CollectorOptions {
    // Case-insensitive substrings naming non-physical display adapters.
    std::vector<std::string> placeholderGpuNames;
    bool parallel = false;
    int maxWorkers = 4;

    static CollectorOptions defaults();
};

class HardwareFactCollector {
public:
    explicit HardwareFactCollector(std::shared_ptr<const PlatformSource> source,
                                   CollectorOptions options = CollectorOptions::defaults());

    // Never throws for source failures; every category degrades to Unknown.
    SystemSnapshot collect() const;

    const PlatformSource& source() const { return *source_; }
    const CollectorOptions& options() const { return options_; }

    bool isPlaceholderGpu(const std::string& name) const;

private:
    OsInfo collectOs(PlatformSession* session) const;
    CpuInfo collectCpu(PlatformSession* session) const;
    MemoryInfo collectMemory(PlatformSession* session) const;
    std::vector<GpuInfo> collectGpus(PlatformSession* session) const;
    std::vector<StorageInfo> collectStorage(PlatformSession* session) const;
    MotherboardInfo collectMotherboard(PlatformSession* session) const;
    std::string collectHostname(PlatformSession* session) const;

    void collectSequential(SystemSnapshot& snapshot, PlatformSession* session) const;
    void collectParallel(SystemSnapshot& snapshot, PlatformSession* session) const;

    std::shared_ptr<const PlatformSource> source_;
    CollectorOptions options_;
};

} // namespace speccle
