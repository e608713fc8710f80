#include "speccle/platform_source.hpp"

#include "speccle/logging.hpp"
#include "speccle/text_utils.hpp"

#include <QByteArray>
#include <QDir>
#include <QStorageInfo>
#include <QString>
#include <QSysInfo>
#include <QThread>

#include <algorithm>
#include <set>

namespace speccle::portable {

bool isPseudoFilesystem(const std::string& fsType) {
    static const std::set<std::string> pseudo = {
        "proc", "sysfs", "tmpfs", "devtmpfs", "cgroup", "cgroup2", "overlay", "squashfs", "devpts", "securityfs",
        "pstore", "mqueue", "tracefs", "fusectl", "debugfs", "configfs", "efivarfs", "autofs", "binfmt_misc",
        "hugetlbfs", "ramfs", "nsfs", "bpf", "fuse.portal", "fuse.gvfsd-fuse", "devfs", "nullfs"};
    return pseudo.count(toLower(fsType)) != 0;
}

Probe<OsInfo> osProbe() {
    return {"QSysInfo", []() -> std::optional<OsInfo> {
                OsInfo info;
                const QString kernelType = QSysInfo::kernelType();
                const std::string kernelVersion = QSysInfo::kernelVersion().toStdString();

                if (kernelType == QLatin1String("winnt")) {
                    info.name = "Windows";
                    info.release = QSysInfo::productVersion().toStdString();
                    info.version = kernelVersion;
                    const auto parts = split(kernelVersion, '.');
                    if (parts.size() >= 3) {
                        info.buildNumber = parts[2];
                    }
                } else {
                    info.name = QSysInfo::prettyProductName().toStdString();
                    info.version = QSysInfo::productVersion().toStdString();
                    info.release = kernelVersion;
                }
                info.architecture = QSysInfo::currentCpuArchitecture().toStdString();

                if (QSysInfo::productType() == QLatin1String("unknown")) {
                    info.version = kUnknown;
                }
                return info;
            }};
}

Probe<CpuInfo> cpuThreadsProbe() {
    return {"QThread", []() -> std::optional<CpuInfo> {
                const int threads = QThread::idealThreadCount();
                if (threads < 1) {
                    return std::nullopt;
                }

                CpuInfo info;
                info.logicalThreads = static_cast<unsigned int>(threads);
                // Assumes two hardware threads per core when nothing better is known.
                info.physicalCores = threads > 1 ? info.logicalThreads / 2 : info.logicalThreads;
                return info;
            }};
}

Probe<std::string> hostnameProbe() {
    return {"QSysInfo", []() -> std::optional<std::string> {
                const std::string host = QSysInfo::machineHostName().toStdString();
                if (host.empty()) {
                    return std::nullopt;
                }
                return host;
            }};
}

Probe<std::vector<StorageInfo>> storageProbe(DriveClassifier classify) {
    return {"QStorageInfo", [classify]() -> std::optional<std::vector<StorageInfo>> {
                std::vector<StorageInfo> drives;
                std::set<std::string> seenDevices;

                for (const QStorageInfo& volume : QStorageInfo::mountedVolumes()) {
                    if (!volume.isValid() || !volume.isReady()) {
                        qCDebug(lcPlatform) << "skipping inaccessible volume" << volume.rootPath();
                        continue;
                    }

                    const std::string fsType = volume.fileSystemType().toStdString();
                    const std::string device = volume.device().toStdString();
                    if (isPseudoFilesystem(fsType) || volume.bytesTotal() <= 0) {
                        continue;
                    }
                    if (!device.empty() && !seenDevices.insert(device).second) {
                        continue;
                    }

                    StorageInfo drive;
                    drive.mountLabel = QDir::toNativeSeparators(volume.rootPath()).toStdString();
                    drive.device = device;
                    drive.filesystem = fsType;
                    drive.totalBytes = static_cast<std::uint64_t>(volume.bytesTotal());
                    drive.freeBytes = static_cast<std::uint64_t>(std::max<qint64>(volume.bytesAvailable(), 0));
                    if (classify) {
                        drive.driveType = classify(drive);
                    }
                    drives.push_back(drive);
                }

                std::sort(drives.begin(), drives.end(), [](const StorageInfo& a, const StorageInfo& b) {
                    return a.mountLabel < b.mountLabel;
                });
                return drives;
            }};
}

} // namespace speccle::portable
