#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace speccle {

// Placeholder for any fact no source could provide.
inline const std::string kUnknown = "Unknown";

struct OsInfo {
    std::string name = kUnknown;
    std::string version = kUnknown;
    std::string release = kUnknown;
    std::string edition = kUnknown;
    std::string buildNumber = kUnknown;
    std::string architecture = kUnknown;
};

// Zero counts and a zero clock mean the value could not be read.
struct CpuInfo {
    std::string model = kUnknown;
    std::string manufacturer = kUnknown;
    // 0 when unknown; the report prints Unknown.
    unsigned int physicalCores = 0;
    unsigned int logicalThreads = 0;
    double clockSpeedGHz = 0.0;
};

struct MemoryInfo {
    std::uint64_t totalBytes = 0;
    std::uint64_t availableBytes = 0;
};

struct GpuInfo {
    std::string name = kUnknown;
    std::string vendor = kUnknown;
    std::optional<std::uint64_t> vramBytes;
};

enum class DriveType {
    Unknown,
    SSD,
    HDD,
    NVMe
};

struct StorageInfo {
    std::string mountLabel = kUnknown;
    std::string device = kUnknown;
    std::string filesystem = kUnknown;
    DriveType driveType = DriveType::Unknown;
    std::uint64_t totalBytes = 0;
    std::uint64_t freeBytes = 0;
};

struct MotherboardInfo {
    std::string manufacturer = kUnknown;
    std::string model = kUnknown;
};

struct SystemSnapshot {
    OsInfo os;
    CpuInfo cpu;
    MemoryInfo memory;
    std::vector<GpuInfo> gpus;
    std::vector<StorageInfo> storage;
    MotherboardInfo motherboard;
    std::string hostname = kUnknown;
    std::chrono::system_clock::time_point capturedAt;
};

bool isUnknown(const std::string& value);
const char* driveTypeName(DriveType type);

// "GenuineIntel" -> "Intel"; unrecognised ids are returned unchanged.
std::string cpuVendorName(const std::string& vendorId);

// Accepts a clock reading in GHz or MHz (sources disagree) and returns GHz.
double normalizeClockGHz(double reading);

// Collects a snapshot with the platform source for the running OS.
SystemSnapshot collectSystemSnapshot();
std::string renderReport(const SystemSnapshot& snapshot);

} // namespace speccle
