#pragma once

#include "speccle/platform_source.hpp"
#include "speccle/source_error.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace speccle::testing {

// Counts how many sessions are currently alive.
class FakeSession : public PlatformSession {
public:
    explicit FakeSession(std::shared_ptr<int> live) : live_(std::move(live)) { ++*live_; }
    ~FakeSession() override { --*live_; }

private:
    std::shared_ptr<int> live_;
};

// Platform source whose probes are set directly by each test.
class FakePlatformSource : public PlatformSource {
public:
    std::string name() const override { return "fake"; }

    std::unique_ptr<PlatformSession> openSession() const override {
        ++*sessionsOpened;
        if (failSession) {
            throw SourceException(SourceError::PermissionDenied, "session refused");
        }
        return std::make_unique<FakeSession>(liveSessions);
    }

    std::vector<Probe<OsInfo>> osProbes(PlatformSession*) const override { return os; }
    std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession*) const override {
        if (failCpuSourceList) {
            throw 7;
        }
        return cpu;
    }
    std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession*) const override { return memory; }
    std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession*) const override { return gpus; }
    std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession*) const override { return storage; }
    std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession*) const override { return motherboard; }
    std::vector<Probe<std::string>> hostnameProbes(PlatformSession*) const override { return hostname; }

    std::vector<Probe<OsInfo>> os;
    std::vector<Probe<CpuInfo>> cpu;
    std::vector<Probe<MemoryReading>> memory;
    std::vector<Probe<std::vector<GpuReading>>> gpus;
    std::vector<Probe<std::vector<StorageInfo>>> storage;
    std::vector<Probe<MotherboardInfo>> motherboard;
    std::vector<Probe<std::string>> hostname;

    bool failSession = false;
    bool failCpuSourceList = false;
    std::shared_ptr<int> sessionsOpened = std::make_shared<int>(0);
    std::shared_ptr<int> liveSessions = std::make_shared<int>(0);
};

template <typename T>
Probe<T> valueProbe(const std::string& name, T value, std::shared_ptr<int> calls = nullptr) {
    return {name, [value, calls]() -> std::optional<T> {
                if (calls) {
                    ++*calls;
                }
                return value;
            }};
}

template <typename T>
Probe<T> unavailableProbe(const std::string& name, std::shared_ptr<int> calls = nullptr) {
    return {name, [calls]() -> std::optional<T> {
                if (calls) {
                    ++*calls;
                }
                return std::nullopt;
            }};
}

template <typename T>
Probe<T> failingProbe(const std::string& name, SourceError error = SourceError::SourceUnavailable,
                      std::shared_ptr<int> calls = nullptr) {
    return {name, [name, error, calls]() -> std::optional<T> {
                if (calls) {
                    ++*calls;
                }
                throw SourceException(error, name + " failed");
            }};
}

template <typename T>
Probe<T> crashingProbe(const std::string& name) {
    return {name, []() -> std::optional<T> { throw std::logic_error("unexpected state"); }};
}

// Throws a value that is not a std::exception, the way COM wrappers do.
template <typename T>
Probe<T> nonStandardThrow(const std::string& name) {
    return {name, []() -> std::optional<T> { throw 42; }};
}

// A source where every probe of every category fails in a different way.
inline FakePlatformSource brokenSource() {
    FakePlatformSource source;
    source.os = {failingProbe<OsInfo>("os-a"), unavailableProbe<OsInfo>("os-b")};
    source.cpu = {failingProbe<CpuInfo>("cpu-a", SourceError::PermissionDenied), crashingProbe<CpuInfo>("cpu-b")};
    source.memory = {failingProbe<MemoryReading>("mem-a"), unavailableProbe<MemoryReading>("mem-b"),
                     nonStandardThrow<MemoryReading>("mem-c")};
    source.gpus = {nonStandardThrow<std::vector<GpuReading>>("gpu-a"), failingProbe<std::vector<GpuReading>>("gpu-b")};
    source.storage = {crashingProbe<std::vector<StorageInfo>>("storage-a")};
    source.motherboard = {failingProbe<MotherboardInfo>("board-a", SourceError::PermissionDenied)};
    source.hostname = {unavailableProbe<std::string>("host-a"), nonStandardThrow<std::string>("host-b")};
    source.failSession = true;
    return source;
}

} // namespace speccle::testing
