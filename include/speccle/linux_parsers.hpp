#pragma once

#include "speccle/platform_source.hpp"
#include "speccle/system_info.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace speccle::linux_text {

// /proc/cpuinfo. Clock is taken from "cpu MHz" and converted to GHz.
CpuInfo parseCpuInfo(const std::string& text);

// /proc/meminfo. Empty when MemTotal is missing.
std::optional<MemoryReading> parseMemInfo(const std::string& text);

// os-release key/value pairs with surrounding quotes removed.
std::map<std::string, std::string> parseOsRelease(const std::string& text);

struct MountEntry {
    std::string device;
    std::string mountPoint;
    std::string fsType;
    std::string options;
};

// /proc/mounts with octal escapes (\040 and friends) decoded.
std::vector<MountEntry> parseMounts(const std::string& text);

struct PciNames {
    std::string vendor;
    std::string device;
};

// Looks up hex ids (with or without a 0x prefix) in pci.ids content.
PciNames lookupPciIds(const std::string& pciIds, const std::string& vendorId, const std::string& deviceId);

// Short vendor name for the common GPU vendors, empty otherwise.
std::string knownPciVendor(const std::string& vendorId);

// Distinct (package, core) pairs under cpuRoot's cpuN/topology directories.
// CPU numbers may have gaps; offline CPUs expose no topology and are skipped.
unsigned int countPhysicalCores(const std::string& cpuRoot);

// "/dev/nvme0n1p2" -> "nvme0n1p2"; empty for non-/dev paths.
std::string blockDeviceName(const std::string& devicePath);

} // namespace speccle::linux_text
