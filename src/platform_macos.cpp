#include "speccle/logging.hpp"
#include "speccle/platform_source.hpp"
#include "speccle/source_error.hpp"
#include "speccle/text_utils.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <mach/mach.h>
#include <sys/sysctl.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <vector>

namespace speccle {
namespace {

std::string sysctlString(const char* name) {
    std::size_t size = 0;
    if (sysctlbyname(name, nullptr, &size, nullptr, 0) != 0 || size == 0) {
        return {};
    }
    std::vector<char> buffer(size);
    if (sysctlbyname(name, buffer.data(), &size, nullptr, 0) != 0) {
        return {};
    }
    return trim(std::string(buffer.data()));
}

template <typename T>
std::optional<T> sysctlValue(const char* name) {
    T value{};
    std::size_t size = sizeof(value);
    if (sysctlbyname(name, &value, &size, nullptr, 0) != 0) {
        return std::nullopt;
    }
    return value;
}

// "8 GB" / "1536 MB" as printed by system_profiler.
std::optional<std::int64_t> parseProfilerSize(const QString& text) {
    const QStringList parts = text.simplified().split(QLatin1Char(' '));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 amount = parts[0].toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    if (parts[1] == QLatin1String("GB")) {
        return amount * 1024 * 1024 * 1024;
    }
    if (parts[1] == QLatin1String("MB")) {
        return amount * 1024 * 1024;
    }
    return std::nullopt;
}

class MacSource : public PlatformSource {
public:
    std::string name() const override { return "macos"; }

    std::vector<Probe<OsInfo>> osProbes(PlatformSession*) const override {
        return {portable::osProbe(), {"sysctl kern", &MacSource::readKernel}};
    }

    std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession*) const override {
        return {{"sysctl hw", &MacSource::readSysctlCpu}, portable::cpuThreadsProbe()};
    }

    std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession*) const override {
        return {{"sysctl+host_statistics64", &MacSource::readMemory}};
    }

    std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession*) const override {
        return {{"system_profiler", &MacSource::readDisplays}};
    }

    std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession*) const override {
        return {portable::storageProbe()};
    }

    std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession*) const override {
        return {{"sysctl hw.model", &MacSource::readModel}};
    }

    std::vector<Probe<std::string>> hostnameProbes(PlatformSession*) const override {
        return {portable::hostnameProbe(), {"gethostname", &MacSource::readGethostname}};
    }

private:
    static std::optional<OsInfo> readKernel() {
        OsInfo info;
        info.name = "macOS";
        info.version = sysctlString("kern.osproductversion");
        info.release = sysctlString("kern.osrelease");
        info.buildNumber = sysctlString("kern.osversion");
        info.architecture = sysctlString("hw.machine");
        return info;
    }

    static std::optional<CpuInfo> readSysctlCpu() {
        CpuInfo info;
        info.model = sysctlString("machdep.cpu.brand_string");
        info.manufacturer = cpuVendorName(sysctlString("machdep.cpu.vendor"));
        if (isUnknown(info.manufacturer) && startsWith(info.model, "Apple")) {
            info.manufacturer = "Apple";
        }
        info.physicalCores = static_cast<unsigned int>(sysctlValue<int>("hw.physicalcpu").value_or(0));
        info.logicalThreads = static_cast<unsigned int>(sysctlValue<int>("hw.logicalcpu").value_or(0));

        // Apple Silicon does not expose a frequency through sysctl.
        if (auto hz = sysctlValue<std::uint64_t>("hw.cpufrequency_max")) {
            info.clockSpeedGHz = static_cast<double>(*hz) / 1e9;
        } else if (auto nominal = sysctlValue<std::uint64_t>("hw.cpufrequency")) {
            info.clockSpeedGHz = static_cast<double>(*nominal) / 1e9;
        }
        return info;
    }

    static std::optional<MemoryReading> readMemory() {
        const auto total = sysctlValue<std::uint64_t>("hw.memsize");
        if (!total) {
            throw SourceException(sourceErrorFromErrno(errno), "sysctl hw.memsize failed");
        }

        MemoryReading reading;
        reading.totalBytes = static_cast<std::int64_t>(*total);

        vm_statistics64_data_t stats{};
        mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
        if (host_statistics64(mach_host_self(), HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&stats), &count) ==
            KERN_SUCCESS) {
            const std::int64_t pageSize = sysconf(_SC_PAGESIZE);
            reading.availableBytes =
                static_cast<std::int64_t>(stats.free_count + stats.inactive_count + stats.purgeable_count) * pageSize;
        }
        return reading;
    }

    static std::optional<std::vector<GpuReading>> readDisplays() {
        QProcess profiler;
        profiler.start(QStringLiteral("/usr/sbin/system_profiler"),
                       {QStringLiteral("-json"), QStringLiteral("SPDisplaysDataType")});
        if (!profiler.waitForFinished(5000) || profiler.exitCode() != 0) {
            profiler.kill();
            throw SourceException(SourceError::SourceUnavailable, "system_profiler did not complete");
        }

        QJsonParseError error{};
        const QJsonDocument doc = QJsonDocument::fromJson(profiler.readAllStandardOutput(), &error);
        if (error.error != QJsonParseError::NoError) {
            throw SourceException(SourceError::InvalidValue, error.errorString().toStdString());
        }

        std::vector<GpuReading> gpus;
        const QJsonArray displays = doc.object().value(QStringLiteral("SPDisplaysDataType")).toArray();
        for (const auto& value : displays) {
            const QJsonObject display = value.toObject();
            GpuReading gpu;
            gpu.name = display.value(QStringLiteral("sppci_model")).toString().toStdString();
            gpu.vendor = display.value(QStringLiteral("spdisplays_vendor")).toString().toStdString();
            if (startsWith(gpu.vendor, "sppci_vendor_")) {
                gpu.vendor = gpu.vendor.substr(13);
            }

            QString vram = display.value(QStringLiteral("spdisplays_vram")).toString();
            if (vram.isEmpty()) {
                vram = display.value(QStringLiteral("spdisplays_vram_shared")).toString();
            }
            gpu.vramBytes = parseProfilerSize(vram);
            gpus.push_back(gpu);
        }
        return gpus;
    }

    static std::optional<MotherboardInfo> readModel() {
        const std::string model = sysctlString("hw.model");
        if (model.empty()) {
            return std::nullopt;
        }
        MotherboardInfo info;
        info.manufacturer = "Apple";
        info.model = model;
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

std::unique_ptr<PlatformSource> makeMacSource() {
    return std::make_unique<MacSource>();
}

} // namespace speccle
