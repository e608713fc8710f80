#include "speccle/system_info.hpp"

#include "speccle/fact_collector.hpp"
#include "speccle/text_utils.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace speccle {
namespace {

constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
constexpr double kMiB = 1024.0 * 1024.0;

std::string fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::string osLine(const OsInfo& os) {
    std::string line;
    auto append = [&line](const std::string& part) {
        if (isUnknown(part)) {
            return;
        }
        if (!line.empty()) {
            line += ' ';
        }
        line += part;
    };

    append(os.name);
    append(os.edition);
    append(os.release);
    if (!isUnknown(os.buildNumber)) {
        append("(Build " + os.buildNumber + ")");
    }
    return line.empty() ? kUnknown : line;
}

std::string gpuLine(const GpuInfo& gpu) {
    std::string line = "GPU: " + gpu.name;
    if (gpu.vramBytes && *gpu.vramBytes > 0) {
        const double vramGB = static_cast<double>(*gpu.vramBytes) / kGiB;
        if (vramGB >= 1.0) {
            line += " (" + fixed(vramGB, 0) + " GB VRAM)";
        } else {
            line += " (" + fixed(static_cast<double>(*gpu.vramBytes) / kMiB, 0) + " MB VRAM)";
        }
    }
    return line;
}

std::string storageLine(const StorageInfo& drive) {
    const double totalGB = static_cast<double>(drive.totalBytes) / kGiB;
    const double freeGB = static_cast<double>(drive.freeBytes) / kGiB;

    std::string total;
    std::string free;
    if (totalGB >= 1000.0) {
        total = fixed(totalGB / 1024.0, 1) + " TB";
        free = freeGB >= 1000.0 ? fixed(freeGB / 1024.0, 2) + " TB" : fixed(freeGB, 0) + " GB";
    } else {
        total = fixed(totalGB, 0) + " GB";
        free = fixed(freeGB, 0) + " GB";
    }

    std::string line = "  - " + drive.mountLabel;
    if (drive.driveType != DriveType::Unknown) {
        line += std::string(" ") + driveTypeName(drive.driveType) + " -";
    }
    return line + " " + total + " (" + free + " free)";
}

} // namespace

bool isUnknown(const std::string& value) {
    return value == kUnknown || trim(value).empty();
}

const char* driveTypeName(DriveType type) {
    switch (type) {
    case DriveType::SSD:
        return "SSD";
    case DriveType::HDD:
        return "HDD";
    case DriveType::NVMe:
        return "NVMe";
    case DriveType::Unknown:
        break;
    }
    return "Unknown";
}

std::string cpuVendorName(const std::string& vendorId) {
    const std::string id = trim(vendorId);
    if (id == "GenuineIntel") {
        return "Intel";
    }
    if (id == "AuthenticAMD") {
        return "AMD";
    }
    return id;
}

// Up to 1000 a reading is taken as GHz unless it exceeds 100, which no real
// clock does, so 100..1000 is read as MHz. Above 1000 it is MHz or kHz.
double normalizeClockGHz(double reading) {
    if (!(reading > 0.0)) {
        return 0.0;
    }
    double ghz = reading > 1000.0 ? reading / 1000.0 : reading;
    if (ghz > 100.0) {
        ghz /= 1000.0;
    }
    return ghz;
}

SystemSnapshot collectSystemSnapshot() {
    const HardwareFactCollector collector{std::shared_ptr<const PlatformSource>(makePlatformSource())};
    return collector.collect();
}

std::string renderReport(const SystemSnapshot& snapshot) {
    std::ostringstream out;

    out << "OS: " << osLine(snapshot.os) << '\n';
    out << "Architecture: " << snapshot.os.architecture << "\n\n";

    out << "CPU: " << snapshot.cpu.model << '\n';
    const auto count = [](unsigned int value) { return value > 0 ? std::to_string(value) : kUnknown; };
    out << "Cores: " << count(snapshot.cpu.physicalCores) << " / Threads: " << count(snapshot.cpu.logicalThreads);
    if (snapshot.cpu.clockSpeedGHz > 0.0) {
        out << " @ " << fixed(snapshot.cpu.clockSpeedGHz, 2) << " GHz";
    }
    out << "\n\n";

    if (snapshot.memory.totalBytes > 0) {
        out << "RAM: " << fixed(static_cast<double>(snapshot.memory.totalBytes) / kGiB, 0) << " GB\n";
        if (snapshot.memory.availableBytes > 0) {
            out << "     (" << fixed(static_cast<double>(snapshot.memory.availableBytes) / kGiB, 1)
                << " GB available)\n";
        }
    } else {
        out << "RAM: " << kUnknown << '\n';
    }
    out << '\n';

    for (const auto& gpu : snapshot.gpus) {
        out << gpuLine(gpu) << '\n';
    }
    if (snapshot.gpus.empty()) {
        out << "GPU: " << kUnknown << '\n';
    }
    out << '\n';

    out << "Storage:\n";
    for (const auto& drive : snapshot.storage) {
        out << storageLine(drive) << '\n';
    }
    if (snapshot.storage.empty()) {
        out << "  No accessible drives detected\n";
    }
    out << '\n';

    const auto& board = snapshot.motherboard;
    if (!isUnknown(board.manufacturer) || !isUnknown(board.model)) {
        std::string text;
        if (!isUnknown(board.manufacturer)) {
            text = board.manufacturer;
        }
        if (!isUnknown(board.model)) {
            text += text.empty() ? board.model : " " + board.model;
        }
        out << "Motherboard: " << text << '\n';
    }

    out << "Hostname: " << snapshot.hostname;

    return out.str();
}

} // namespace speccle
