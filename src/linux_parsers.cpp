#include "speccle/linux_parsers.hpp"

#include "speccle/text_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace speccle::linux_text {
namespace {

std::string normalizeHexId(std::string id) {
    id = toLower(trim(id));
    if (startsWith(id, "0x")) {
        id = id.substr(2);
    }
    return id;
}

bool parseUnsigned(const std::string& text, unsigned long long& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtoull(text.c_str(), &end, 10);
    return end != text.c_str();
}

std::string decodeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string octal = field.substr(i + 1, 3);
            if (octal.find_first_not_of("01234567") == std::string::npos) {
                out += static_cast<char>(std::strtol(octal.c_str(), nullptr, 8));
                i += 3;
                continue;
            }
        }
        out += field[i];
    }
    return out;
}

} // namespace

CpuInfo parseCpuInfo(const std::string& text) {
    CpuInfo info;
    std::map<std::string, unsigned int> coresPerPackage;
    std::string currentPackage = "0";
    unsigned int processors = 0;
    bool clockSeen = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));
        unsigned long long number = 0;

        if (key == "processor") {
            ++processors;
        } else if (key == "model name" && isUnknown(info.model)) {
            info.model = value;
        } else if (key == "vendor_id" && isUnknown(info.manufacturer)) {
            info.manufacturer = cpuVendorName(value);
        } else if (key == "physical id") {
            currentPackage = value;
        } else if (key == "cpu cores" && parseUnsigned(value, number)) {
            coresPerPackage[currentPackage] = static_cast<unsigned int>(number);
        } else if (key == "cpu MHz" && !clockSeen) {
            info.clockSpeedGHz = normalizeClockGHz(std::strtod(value.c_str(), nullptr));
            clockSeen = true;
        }
    }

    info.logicalThreads = processors;
    for (const auto& [package, cores] : coresPerPackage) {
        info.physicalCores += cores;
    }
    return info;
}

std::optional<MemoryReading> parseMemInfo(const std::string& text) {
    std::optional<long long> totalKiB;
    std::optional<long long> availableKiB;
    std::optional<long long> freeKiB;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 2) {
            continue;
        }
        const long long value = std::strtoll(tokens[1].c_str(), nullptr, 10);
        if (tokens[0] == "MemTotal:") {
            totalKiB = value;
        } else if (tokens[0] == "MemAvailable:") {
            availableKiB = value;
        } else if (tokens[0] == "MemFree:") {
            freeKiB = value;
        }
    }

    if (!totalKiB) {
        return std::nullopt;
    }

    MemoryReading reading;
    reading.totalBytes = *totalKiB * 1024;
    reading.availableBytes = availableKiB ? *availableKiB * 1024 : freeKiB.value_or(0) * 1024;
    return reading;
}

std::map<std::string, std::string> parseOsRelease(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto pos = line.find('=');
        if (pos == std::string::npos || startsWith(trim(line), "#")) {
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

std::vector<MountEntry> parseMounts(const std::string& text) {
    std::vector<MountEntry> mounts;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const auto parts = splitWhitespace(line);
        if (parts.size() < 4) {
            continue;
        }
        mounts.push_back({decodeMountField(parts[0]), decodeMountField(parts[1]), parts[2], parts[3]});
    }
    return mounts;
}

PciNames lookupPciIds(const std::string& pciIds, const std::string& vendorId, const std::string& deviceId) {
    PciNames names;
    const std::string vendor = normalizeHexId(vendorId);
    const std::string device = normalizeHexId(deviceId);
    bool inVendor = false;

    std::istringstream in(pciIds);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (startsWith(line, "C ")) {
            break;
        }

        if (line.front() != '\t') {
            if (inVendor) {
                break;
            }
            if (toLower(line.substr(0, 4)) == vendor) {
                inVendor = true;
                names.vendor = trim(line.substr(4));
            }
            continue;
        }

        if (inVendor && line.size() > 1 && line[1] != '\t' && toLower(line.substr(1, 4)) == device) {
            names.device = trim(line.substr(5));
            break;
        }
    }
    return names;
}

std::string knownPciVendor(const std::string& vendorId) {
    static const std::map<std::string, std::string> vendors = {
        {"10de", "NVIDIA"},
        {"1002", "AMD"},
        {"1022", "AMD"},
        {"8086", "Intel"},
        {"1414", "Microsoft"},
        {"15ad", "VMware"},
        {"80ee", "VirtualBox"},
        {"1af4", "Red Hat"},
        {"1234", "QEMU"},
        {"1a03", "ASPEED"},
        {"5143", "Qualcomm"},
    };
    auto it = vendors.find(normalizeHexId(vendorId));
    return it == vendors.end() ? std::string() : it->second;
}

unsigned int countPhysicalCores(const std::string& cpuRoot) {
    namespace fs = std::filesystem;
    static const std::regex cpuDir("^cpu[0-9]+$");

    std::set<std::pair<std::string, std::string>> cores;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(cpuRoot, ec)) {
        if (!std::regex_match(entry.path().filename().string(), cpuDir)) {
            continue;
        }
        const fs::path topology = entry.path() / "topology";
        const std::string core = readFileFirstLine((topology / "core_id").string());
        if (!core.empty()) {
            cores.emplace(readFileFirstLine((topology / "physical_package_id").string()), core);
        }
    }
    return static_cast<unsigned int>(cores.size());
}

std::string blockDeviceName(const std::string& devicePath) {
    if (!startsWith(devicePath, "/dev/")) {
        return {};
    }
    const auto slash = devicePath.find_last_of('/');
    return devicePath.substr(slash + 1);
}

} // namespace speccle::linux_text
