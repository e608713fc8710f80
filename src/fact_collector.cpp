#include "speccle/fact_collector.hpp"

#include "speccle/fallback_chain.hpp"
#include "speccle/logging.hpp"
#include "speccle/text_utils.hpp"

#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace speccle {
namespace {

std::string orUnknown(const std::string& value) {
    std::string trimmed = trim(value);
    return trimmed.empty() ? kUnknown : trimmed;
}

void fillString(std::string& into, const std::string& from) {
    if (isUnknown(into) && !isUnknown(from)) {
        into = from;
    }
}

OsInfo normalized(OsInfo info) {
    info.name = orUnknown(info.name);
    info.version = orUnknown(info.version);
    info.release = orUnknown(info.release);
    info.edition = orUnknown(info.edition);
    info.buildNumber = orUnknown(info.buildNumber);
    info.architecture = orUnknown(info.architecture);
    return info;
}

CpuInfo normalized(CpuInfo info) {
    info.model = orUnknown(info.model);
    info.manufacturer = orUnknown(info.manufacturer);
    if (!std::isfinite(info.clockSpeedGHz) || info.clockSpeedGHz < 0.0) {
        info.clockSpeedGHz = 0.0;
    }
    return info;
}

MotherboardInfo normalized(MotherboardInfo info) {
    info.manufacturer = orUnknown(info.manufacturer);
    info.model = orUnknown(info.model);
    return info;
}

StorageInfo normalized(StorageInfo info) {
    info.mountLabel = orUnknown(info.mountLabel);
    info.device = orUnknown(info.device);
    info.filesystem = orUnknown(info.filesystem);
    info.freeBytes = std::min(info.freeBytes, info.totalBytes);
    return info;
}

// Runs one category; anything that escapes it (a source list that cannot be
// built, a throwing sanitizer) degrades that category to its defaults.
template <typename T, typename Body>
T guarded(const char* category, Body body, T fallback) {
    try {
        return body();
    } catch (const std::exception& e) {
        qCWarning(lcCollector) << category << "collection failed:" << e.what();
    } catch (...) {
        qCWarning(lcCollector) << category << "collection failed with a non-standard exception";
    }
    return fallback;
}

} // namespace

CollectorOptions CollectorOptions::defaults() {
    CollectorOptions options;
    options.placeholderGpuNames = {
        "Microsoft Basic Display",
        "Microsoft Basic Render",
        "Microsoft Remote Display",
        "Standard VGA Graphics",
        "llvmpipe",
        "softpipe",
        "SVGA3D",
        "VirtualBox Graphics",
        "Hyper-V Video",
    };
    return options;
}

HardwareFactCollector::HardwareFactCollector(std::shared_ptr<const PlatformSource> source,
                                             CollectorOptions options)
    : source_(source ? std::move(source) : std::shared_ptr<const PlatformSource>(makeUnsupportedSource())),
      options_(std::move(options)) {
    if (options_.maxWorkers < 1) {
        options_.maxWorkers = 1;
    }
}

bool HardwareFactCollector::isPlaceholderGpu(const std::string& name) const {
    const std::string lowered = toLower(name);
    for (const auto& pattern : options_.placeholderGpuNames) {
        if (!pattern.empty() && lowered.find(toLower(pattern)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

SystemSnapshot HardwareFactCollector::collect() const {
    SystemSnapshot snapshot;
    snapshot.capturedAt = std::chrono::system_clock::now();

    std::unique_ptr<PlatformSession> session;
    try {
        session = source_->openSession();
    } catch (const SourceException& e) {
        qCWarning(lcCollector) << "platform session unavailable:" << sourceErrorName(e.error()) << e.what();
    } catch (const std::exception& e) {
        qCWarning(lcCollector) << "platform session unavailable:" << e.what();
    } catch (...) {
        qCWarning(lcCollector) << "platform session unavailable: non-standard exception";
    }

    qCDebug(lcCollector) << "collecting with" << QString::fromStdString(source_->name())
                         << (options_.parallel ? "in parallel" : "sequentially");

    if (options_.parallel) {
        collectParallel(snapshot, session.get());
    } else {
        collectSequential(snapshot, session.get());
    }
    return snapshot;
}

void HardwareFactCollector::collectSequential(SystemSnapshot& snapshot, PlatformSession* session) const {
    snapshot.os = guarded("os", [&] { return collectOs(session); }, OsInfo{});
    snapshot.cpu = guarded("cpu", [&] { return collectCpu(session); }, CpuInfo{});
    snapshot.memory = guarded("memory", [&] { return collectMemory(session); }, MemoryInfo{});
    snapshot.gpus = guarded("gpu", [&] { return collectGpus(session); }, std::vector<GpuInfo>{});
    snapshot.storage = guarded("storage", [&] { return collectStorage(session); }, std::vector<StorageInfo>{});
    snapshot.motherboard = guarded("motherboard", [&] { return collectMotherboard(session); }, MotherboardInfo{});
    snapshot.hostname = guarded("hostname", [&] { return collectHostname(session); }, kUnknown);
}

void HardwareFactCollector::collectParallel(SystemSnapshot& snapshot, PlatformSession* session) const {
    QThreadPool pool;
    pool.setMaxThreadCount(options_.maxWorkers);

    QFuture<OsInfo> os = QtConcurrent::run(&pool, [this, session] {
        return guarded("os", [&] { return collectOs(session); }, OsInfo{});
    });
    QFuture<CpuInfo> cpu = QtConcurrent::run(&pool, [this, session] {
        return guarded("cpu", [&] { return collectCpu(session); }, CpuInfo{});
    });
    QFuture<MemoryInfo> memory = QtConcurrent::run(&pool, [this, session] {
        return guarded("memory", [&] { return collectMemory(session); }, MemoryInfo{});
    });
    QFuture<std::vector<GpuInfo>> gpus = QtConcurrent::run(&pool, [this, session] {
        return guarded("gpu", [&] { return collectGpus(session); }, std::vector<GpuInfo>{});
    });
    QFuture<std::vector<StorageInfo>> storage = QtConcurrent::run(&pool, [this, session] {
        return guarded("storage", [&] { return collectStorage(session); }, std::vector<StorageInfo>{});
    });
    QFuture<MotherboardInfo> motherboard = QtConcurrent::run(&pool, [this, session] {
        return guarded("motherboard", [&] { return collectMotherboard(session); }, MotherboardInfo{});
    });
    QFuture<std::string> hostname = QtConcurrent::run(&pool, [this, session] {
        return guarded("hostname", [&] { return collectHostname(session); }, kUnknown);
    });

    // Each field is written once, here, after its own task finished.
    snapshot.os = os.result();
    snapshot.cpu = cpu.result();
    snapshot.memory = memory.result();
    snapshot.gpus = gpus.result();
    snapshot.storage = storage.result();
    snapshot.motherboard = motherboard.result();
    snapshot.hostname = hostname.result();
}

OsInfo HardwareFactCollector::collectOs(PlatformSession* session) const {
    auto known = [](const OsInfo& os) {
        return !isUnknown(os.name) || !isUnknown(os.release) || !isUnknown(os.version);
    };
    auto complete = [](const OsInfo& os) {
        return !isUnknown(os.name) && !isUnknown(os.release) && !isUnknown(os.version) &&
               !isUnknown(os.architecture);
    };
    auto fill = [](OsInfo& into, const OsInfo& from) {
        fillString(into.name, from.name);
        fillString(into.version, from.version);
        fillString(into.release, from.release);
        fillString(into.edition, from.edition);
        fillString(into.buildNumber, from.buildNumber);
        fillString(into.architecture, from.architecture);
    };

    auto result = FallbackChain<OsInfo>("os", source_->osProbes(session))
                      .validateWith(known)
                      .fillGapsWith(complete, fill)
                      .resolve();
    return normalized(result.value_or(OsInfo{}));
}

CpuInfo HardwareFactCollector::collectCpu(PlatformSession* session) const {
    auto known = [](const CpuInfo& cpu) {
        if (!std::isfinite(cpu.clockSpeedGHz) || cpu.clockSpeedGHz < 0.0) {
            return false;
        }
        return !isUnknown(cpu.model) || cpu.logicalThreads > 0;
    };
    auto complete = [](const CpuInfo& cpu) {
        return !isUnknown(cpu.model) && cpu.physicalCores > 0 && cpu.logicalThreads > 0 && cpu.clockSpeedGHz > 0.0;
    };
    auto fill = [](CpuInfo& into, const CpuInfo& from) {
        fillString(into.model, from.model);
        fillString(into.manufacturer, from.manufacturer);
        if (into.physicalCores == 0) {
            into.physicalCores = from.physicalCores;
        }
        if (into.logicalThreads == 0) {
            into.logicalThreads = from.logicalThreads;
        }
        if (into.clockSpeedGHz <= 0.0) {
            into.clockSpeedGHz = from.clockSpeedGHz;
        }
    };

    auto result = FallbackChain<CpuInfo>("cpu", source_->cpuProbes(session))
                      .validateWith(known)
                      .fillGapsWith(complete, fill)
                      .resolve();
    return normalized(result.value_or(CpuInfo{}));
}

MemoryInfo HardwareFactCollector::collectMemory(PlatformSession* session) const {
    auto sane = [](const MemoryReading& reading) {
        return reading.totalBytes > 0 && reading.availableBytes >= 0;
    };

    MemoryInfo info;
    auto result = FallbackChain<MemoryReading>("memory", source_->memoryProbes(session)).validateWith(sane).resolve();
    if (result) {
        info.totalBytes = static_cast<std::uint64_t>(result->totalBytes);
        info.availableBytes = std::min(static_cast<std::uint64_t>(result->availableBytes), info.totalBytes);
    }
    return info;
}

std::vector<GpuInfo> HardwareFactCollector::collectGpus(PlatformSession* session) const {
    std::vector<Probe<std::vector<GpuInfo>>> probes;
    for (auto& raw : source_->gpuProbes(session)) {
        auto read = std::move(raw.read);
        probes.push_back({raw.source, [this, read]() -> std::optional<std::vector<GpuInfo>> {
                              auto readings = read();
                              if (!readings) {
                                  return std::nullopt;
                              }

                              std::vector<GpuInfo> gpus;
                              for (const auto& reading : *readings) {
                                  const std::string name = trim(reading.name);
                                  if (name.empty() || isPlaceholderGpu(name)) {
                                      qCDebug(lcCollector) << "skipping placeholder adapter"
                                                           << QString::fromStdString(reading.name);
                                      continue;
                                  }

                                  GpuInfo gpu;
                                  gpu.name = name;
                                  gpu.vendor = orUnknown(reading.vendor);
                                  if (reading.vramBytes && *reading.vramBytes >= 0) {
                                      gpu.vramBytes = static_cast<std::uint64_t>(*reading.vramBytes);
                                  }
                                  gpus.push_back(std::move(gpu));
                              }
                              return gpus;
                          }});
    }

    auto result = FallbackChain<std::vector<GpuInfo>>("gpu", std::move(probes))
                      .validateWith([](const std::vector<GpuInfo>& gpus) { return !gpus.empty(); })
                      .resolve();
    return result.value_or(std::vector<GpuInfo>{});
}

std::vector<StorageInfo> HardwareFactCollector::collectStorage(PlatformSession* session) const {
    auto result = FallbackChain<std::vector<StorageInfo>>("storage", source_->storageProbes(session))
                      .validateWith([](const std::vector<StorageInfo>& drives) { return !drives.empty(); })
                      .resolve();

    std::vector<StorageInfo> drives;
    if (result) {
        drives.reserve(result->size());
        for (auto& drive : *result) {
            drives.push_back(normalized(std::move(drive)));
        }
    }
    return drives;
}

MotherboardInfo HardwareFactCollector::collectMotherboard(PlatformSession* session) const {
    auto known = [](const MotherboardInfo& board) {
        return !isUnknown(board.manufacturer) || !isUnknown(board.model);
    };
    auto complete = [](const MotherboardInfo& board) {
        return !isUnknown(board.manufacturer) && !isUnknown(board.model);
    };
    auto fill = [](MotherboardInfo& into, const MotherboardInfo& from) {
        fillString(into.manufacturer, from.manufacturer);
        fillString(into.model, from.model);
    };

    auto result = FallbackChain<MotherboardInfo>("motherboard", source_->motherboardProbes(session))
                      .validateWith(known)
                      .fillGapsWith(complete, fill)
                      .resolve();
    return normalized(result.value_or(MotherboardInfo{}));
}

std::string HardwareFactCollector::collectHostname(PlatformSession* session) const {
    auto result = FallbackChain<std::string>("hostname", source_->hostnameProbes(session))
                      .validateWith([](const std::string& host) { return !isUnknown(host); })
                      .resolve();
    return orUnknown(result.value_or(kUnknown));
}

} // namespace speccle
