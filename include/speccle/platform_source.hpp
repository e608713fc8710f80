#pragma once

#include "speccle/fallback_chain.hpp"
#include "speccle/system_info.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace speccle {

// Raw readings keep the sign sources report so the collector can reject or
// sanitize them instead of wrapping to huge unsigned values.
struct MemoryReading {
    std::int64_t totalBytes = 0;
    std::int64_t availableBytes = 0;
};

struct GpuReading {
    std::string name;
    std::string vendor;
    std::optional<std::int64_t> vramBytes;
};

// Per-collection resources (management-interface connections and the like).
// Released when the collector drops it at the end of collect().
class PlatformSession {
public:
    virtual ~PlatformSession() = default;
};

// Capability set for one operating system family. Chosen once at startup;
// category logic never checks the platform again.
class PlatformSource {
public:
    virtual ~PlatformSource() = default;

    virtual std::string name() const = 0;

    // Throws SourceException when the session cannot be opened. Probes that
    // need it must cope with a null session.
    virtual std::unique_ptr<PlatformSession> openSession() const;

    virtual std::vector<Probe<OsInfo>> osProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession* session) const = 0;
    virtual std::vector<Probe<std::string>> hostnameProbes(PlatformSession* session) const = 0;
};

std::unique_ptr<PlatformSource> makePlatformSource();
std::unique_ptr<PlatformSource> makeUnsupportedSource();

#if defined(__linux__)
std::unique_ptr<PlatformSource> makeLinuxSource();
#elif defined(_WIN32)
std::unique_ptr<PlatformSource> makeWindowsSource();
#elif defined(__APPLE__)
std::unique_ptr<PlatformSource> makeMacSource();
#endif

// Qt-backed sources that work on every platform.
namespace portable {

Probe<OsInfo> osProbe();
Probe<CpuInfo> cpuThreadsProbe();
Probe<std::string> hostnameProbe();

using DriveClassifier = DriveType (*)(const StorageInfo& drive);
Probe<std::vector<StorageInfo>> storageProbe(DriveClassifier classify = nullptr);

// True for pseudo and virtual filesystems that never describe a real drive.
bool isPseudoFilesystem(const std::string& fsType);

} // namespace portable

} // namespace speccle
