#include "speccle/linux_parsers.hpp"
#include "speccle/logging.hpp"
#include "speccle/platform_source.hpp"
#include "speccle/source_error.hpp"
#include "speccle/text_utils.hpp"

#include <QString>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace speccle {
namespace {

namespace fs = std::filesystem;

// Throws SourceException with the errno-derived reason when the file cannot
// be opened, unlike readFileContents which hides the failure.
std::string readRequired(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        const int err = errno;
        throw SourceException(sourceErrorFromErrno(err), path + ": " + std::strerror(err));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string readPciIds() {
    static const char* const paths[] = {"/usr/share/hwdata/pci.ids", "/usr/share/misc/pci.ids", "/usr/share/pci.ids"};
    for (const char* path : paths) {
        std::string content = readFileContents(path);
        if (!content.empty()) {
            return content;
        }
    }
    return {};
}

std::optional<double> readMaxClockGHz() {
    const std::string khz = readFileFirstLine("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
    if (khz.empty()) {
        return std::nullopt;
    }
    const double value = std::strtod(khz.c_str(), nullptr);
    if (value <= 0.0) {
        return std::nullopt;
    }
    return value / 1000.0 / 1000.0;
}

// Firmware fills unset DMI strings with vendor boilerplate.
std::string readDmi(const std::string& field) {
    static const std::set<std::string> placeholders = {
        "default string", "to be filled by o.e.m.", "not applicable", "system product name",
        "system manufacturer", "not specified", "none", "0123456789"};
    const std::string value = readFileFirstLine("/sys/class/dmi/id/" + field);
    return placeholders.count(toLower(value)) != 0 ? std::string() : value;
}

DriveType classifyLinuxDrive(const StorageInfo& drive) {
    std::string name = linux_text::blockDeviceName(drive.device);
    if (name.empty()) {
        return DriveType::Unknown;
    }
    if (startsWith(name, "nvme")) {
        return DriveType::NVMe;
    }

    std::error_code ec;
    const fs::path blockPath = fs::path("/sys/class/block") / name;
    if (fs::exists(blockPath / "partition", ec)) {
        const fs::path resolved = fs::canonical(blockPath, ec);
        if (ec) {
            return DriveType::Unknown;
        }
        name = resolved.parent_path().filename().string();
    }

    const std::string rotational = readFileFirstLine("/sys/block/" + name + "/queue/rotational");
    if (rotational == "1") {
        return DriveType::HDD;
    }
    if (rotational == "0" && !startsWith(name, "loop") && !startsWith(name, "dm-") && !startsWith(name, "zram")) {
        return DriveType::SSD;
    }
    return DriveType::Unknown;
}

class LinuxSource : public PlatformSource {
public:
    std::string name() const override { return "linux"; }

    std::vector<Probe<OsInfo>> osProbes(PlatformSession*) const override {
        return {portable::osProbe(), {"uname+os-release", &LinuxSource::readUnameOsRelease}};
    }

    std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession*) const override {
        return {{"/proc/cpuinfo", &LinuxSource::readProcCpuInfo},
                {"sysfs cpu", &LinuxSource::readSysfsCpu},
                portable::cpuThreadsProbe()};
    }

    std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession*) const override {
        return {{"/proc/meminfo", &LinuxSource::readProcMemInfo}, {"sysinfo", &LinuxSource::readSysinfo}};
    }

    std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession*) const override {
        return {{"drm", &LinuxSource::readDrmCards}, {"nvidia procfs", &LinuxSource::readNvidiaProc}};
    }

    std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession*) const override {
        return {portable::storageProbe(&classifyLinuxDrive), {"/proc/mounts", &LinuxSource::readProcMounts}};
    }

    std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession*) const override {
        return {{"dmi board", &LinuxSource::readDmiBoard},
                {"dmi system", &LinuxSource::readDmiSystem},
                {"device-tree", &LinuxSource::readDeviceTree}};
    }

    std::vector<Probe<std::string>> hostnameProbes(PlatformSession*) const override {
        return {portable::hostnameProbe(), {"gethostname", &LinuxSource::readGethostname}};
    }

private:
    static std::optional<OsInfo> readUnameOsRelease() {
        OsInfo info;
        struct utsname uts {};
        if (uname(&uts) == 0) {
            info.name = uts.sysname;
            info.release = uts.release;
            info.architecture = uts.machine;
        }

        std::string text = readFileContents("/etc/os-release");
        if (text.empty()) {
            text = readFileContents("/usr/lib/os-release");
        }
        const auto release = linux_text::parseOsRelease(text);
        if (auto it = release.find("PRETTY_NAME"); it != release.end()) {
            info.name = it->second;
        }
        if (auto it = release.find("VERSION_ID"); it != release.end()) {
            info.version = it->second;
        }
        if (auto it = release.find("BUILD_ID"); it != release.end()) {
            info.buildNumber = it->second;
        }
        return info;
    }

    static std::optional<CpuInfo> readProcCpuInfo() {
        CpuInfo info = linux_text::parseCpuInfo(readRequired("/proc/cpuinfo"));
        if (auto maxClock = readMaxClockGHz()) {
            info.clockSpeedGHz = *maxClock;
        }
        return info;
    }

    static std::optional<CpuInfo> readSysfsCpu() {
        const long online = sysconf(_SC_NPROCESSORS_ONLN);
        if (online < 1) {
            throw SourceException(sourceErrorFromErrno(errno), "sysconf(_SC_NPROCESSORS_ONLN) failed");
        }

        CpuInfo info;
        info.logicalThreads = static_cast<unsigned int>(online);

        info.physicalCores = linux_text::countPhysicalCores("/sys/devices/system/cpu");

        if (auto maxClock = readMaxClockGHz()) {
            info.clockSpeedGHz = *maxClock;
        }
        return info;
    }

    static std::optional<MemoryReading> readProcMemInfo() {
        auto reading = linux_text::parseMemInfo(readRequired("/proc/meminfo"));
        if (!reading) {
            throw SourceException(SourceError::InvalidValue, "/proc/meminfo has no MemTotal");
        }
        return reading;
    }

    static std::optional<MemoryReading> readSysinfo() {
        struct sysinfo data {};
        if (sysinfo(&data) != 0) {
            throw SourceException(sourceErrorFromErrno(errno), "sysinfo failed");
        }

        const std::int64_t unit = data.mem_unit;
        MemoryReading reading;
        reading.totalBytes = static_cast<std::int64_t>(data.totalram) * unit;
        reading.availableBytes = static_cast<std::int64_t>(data.freeram + data.bufferram) * unit;
        return reading;
    }

    static std::optional<std::vector<GpuReading>> readDrmCards() {
        std::error_code ec;
        fs::directory_iterator it("/sys/class/drm", ec);
        if (ec) {
            throw SourceException(sourceErrorFromErrno(ec.value()), "/sys/class/drm: " + ec.message());
        }

        static const std::regex cardPattern("^card[0-9]+$");
        std::vector<std::string> cards;
        for (const auto& entry : it) {
            const std::string name = entry.path().filename().string();
            if (std::regex_match(name, cardPattern)) {
                cards.push_back(name);
            }
        }
        std::sort(cards.begin(), cards.end());

        const std::string pciIds = readPciIds();
        std::vector<GpuReading> gpus;
        for (const auto& card : cards) {
            const std::string device = "/sys/class/drm/" + card + "/device/";
            const std::string vendorId = readFileFirstLine(device + "vendor");
            const std::string deviceId = readFileFirstLine(device + "device");
            if (vendorId.empty()) {
                continue;
            }

            const auto names = linux_text::lookupPciIds(pciIds, vendorId, deviceId);
            const std::string shortVendor = linux_text::knownPciVendor(vendorId);

            GpuReading gpu;
            gpu.vendor = shortVendor.empty() ? names.vendor : shortVendor;
            if (!names.device.empty()) {
                gpu.name = gpu.vendor.empty() ? names.device : gpu.vendor + " " + names.device;
            } else {
                const std::string label = readFileFirstLine(device + "label");
                gpu.name = !label.empty() ? label : (gpu.vendor.empty() ? vendorId : gpu.vendor) + " GPU " + deviceId;
            }

            const std::string vram = readFileFirstLine(device + "mem_info_vram_total");
            if (!vram.empty()) {
                gpu.vramBytes = std::strtoll(vram.c_str(), nullptr, 10);
            }
            gpus.push_back(gpu);
        }
        return gpus;
    }

    static std::optional<std::vector<GpuReading>> readNvidiaProc() {
        std::error_code ec;
        fs::directory_iterator it("/proc/driver/nvidia/gpus", ec);
        if (ec) {
            return std::nullopt;
        }

        std::vector<GpuReading> gpus;
        for (const auto& entry : it) {
            const std::string text = readFileContents((entry.path() / "information").string());
            for (const auto& line : split(text, '\n')) {
                if (startsWith(line, "Model:")) {
                    GpuReading gpu;
                    gpu.name = trim(line.substr(6));
                    gpu.vendor = "NVIDIA";
                    gpus.push_back(gpu);
                    break;
                }
            }
        }
        return gpus;
    }

    static std::optional<std::vector<StorageInfo>> readProcMounts() {
        const auto mounts = linux_text::parseMounts(readRequired("/proc/mounts"));

        std::vector<StorageInfo> drives;
        std::set<std::string> seen;
        for (const auto& mount : mounts) {
            if (portable::isPseudoFilesystem(mount.fsType) || !startsWith(mount.device, "/dev/")) {
                continue;
            }
            if (mount.options.find("bind") != std::string::npos || seen.count(mount.device) != 0) {
                continue;
            }

            struct statvfs stat {};
            if (statvfs(mount.mountPoint.c_str(), &stat) != 0) {
                qCDebug(lcPlatform) << "skipping" << QString::fromStdString(mount.mountPoint) << std::strerror(errno);
                continue;
            }
            if (stat.f_blocks == 0) {
                continue;
            }

            seen.insert(mount.device);
            StorageInfo drive;
            drive.mountLabel = mount.mountPoint;
            drive.device = mount.device;
            drive.filesystem = mount.fsType;
            drive.totalBytes = static_cast<std::uint64_t>(stat.f_blocks) * stat.f_frsize;
            drive.freeBytes = static_cast<std::uint64_t>(stat.f_bavail) * stat.f_frsize;
            drive.driveType = classifyLinuxDrive(drive);
            drives.push_back(drive);
        }

        std::sort(drives.begin(), drives.end(), [](const StorageInfo& a, const StorageInfo& b) {
            return a.mountLabel < b.mountLabel;
        });
        return drives;
    }

    static std::optional<MotherboardInfo> readDmiBoard() {
        MotherboardInfo info;
        info.manufacturer = readDmi("board_vendor");
        info.model = readDmi("board_name");
        return info;
    }

    static std::optional<MotherboardInfo> readDmiSystem() {
        MotherboardInfo info;
        info.manufacturer = readDmi("sys_vendor");
        info.model = readDmi("product_name");
        return info;
    }

    static std::optional<MotherboardInfo> readDeviceTree() {
        std::string model = readFileContents("/proc/device-tree/model");
        if (model.empty()) {
            model = readFileContents("/sys/firmware/devicetree/base/model");
        }
        model.erase(std::remove(model.begin(), model.end(), '\0'), model.end());
        if (trim(model).empty()) {
            return std::nullopt;
        }

        MotherboardInfo info;
        info.model = trim(model);
        return info;
    }

    static std::optional<std::string> readGethostname() {
        char host[256] = {};
        if (gethostname(host, sizeof(host) - 1) != 0) {
            throw SourceException(sourceErrorFromErrno(errno), "gethostname failed");
        }
        return std::string(host);
    }
};

} // namespace

std::unique_ptr<PlatformSource> makeLinuxSource() {
    return std::make_unique<LinuxSource>();
}

} // namespace speccle
