#include "speccle/platform_source.hpp"

#include "speccle/logging.hpp"

#include <QString>

namespace speccle {
namespace {

// Any OS without a dedicated source: Qt's portable queries only.
class UnsupportedSource : public PlatformSource {
public:
    std::string name() const override { return "unsupported"; }

    std::vector<Probe<OsInfo>> osProbes(PlatformSession*) const override { return {portable::osProbe()}; }

    std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession*) const override {
        return {portable::cpuThreadsProbe()};
    }

    std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession*) const override { return {}; }

    std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession*) const override { return {}; }

    std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession*) const override {
        return {portable::storageProbe()};
    }

    std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession*) const override { return {}; }

    std::vector<Probe<std::string>> hostnameProbes(PlatformSession*) const override {
        return {portable::hostnameProbe()};
    }
};

} // namespace

std::unique_ptr<PlatformSession> PlatformSource::openSession() const {
    return nullptr;
}

std::unique_ptr<PlatformSource> makeUnsupportedSource() {
    return std::make_unique<UnsupportedSource>();
}

std::unique_ptr<PlatformSource> makePlatformSource() {
#if defined(__linux__)
    auto source = makeLinuxSource();
#elif defined(_WIN32)
    auto source = makeWindowsSource();
#elif defined(__APPLE__)
    auto source = makeMacSource();
#else
    auto source = makeUnsupportedSource();
#endif
    qCDebug(lcPlatform) << "selected platform source" << QString::fromStdString(source->name());
    return source;
}

} // namespace speccle
