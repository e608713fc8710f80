#include "speccle/logging.hpp"
#include "speccle/platform_source.hpp"
#include "speccle/source_error.hpp"
#include "speccle/text_utils.hpp"

#include <QSettings>
#include <QString>
#include <QSysInfo>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <comdef.h>
#include <dxgi.h>
#include <wbemidl.h>
#include <winioctl.h>
#include <wrl/client.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <vector>

namespace speccle {
namespace {

using Microsoft::WRL::ComPtr;

std::string fromWide(const wchar_t* text) {
    return text ? QString::fromWCharArray(text).toStdString() : std::string();
}

SourceError errorFromHresult(HRESULT hr) {
    return hr == E_ACCESSDENIED || hr == WBEM_E_ACCESS_DENIED ? SourceError::PermissionDenied
                                                             : SourceError::SourceUnavailable;
}

struct WmiValue {
    std::string text;
    std::optional<std::int64_t> number;
};

using WmiRow = std::map<std::string, WmiValue>;

WmiValue fromVariant(const VARIANT& value) {
    WmiValue out;
    switch (value.vt) {
    case VT_BSTR:
        out.text = trim(fromWide(value.bstrVal));
        // WMI hands out 64-bit integers as strings.
        if (!out.text.empty() && out.text.find_first_not_of("-0123456789") == std::string::npos) {
            out.number = _wcstoi64(value.bstrVal, nullptr, 10);
        }
        break;
    case VT_I4:
        out.number = value.lVal;
        break;
    case VT_UI4:
        out.number = value.ulVal;
        break;
    case VT_I2:
        out.number = value.iVal;
        break;
    case VT_UI2:
        out.number = value.uiVal;
        break;
    case VT_UI1:
        out.number = value.bVal;
        break;
    case VT_BOOL:
        out.number = value.boolVal == VARIANT_TRUE ? 1 : 0;
        break;
    default:
        break;
    }
    if (out.text.empty() && out.number) {
        out.text = std::to_string(*out.number);
    }
    return out;
}

// COM apartment plus a ROOT\CIMV2 connection, alive for one collect() call.
class WmiSession : public PlatformSession {
public:
    WmiSession() {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        if (SUCCEEDED(hr)) {
            uninitialize_ = true;
        } else if (hr != RPC_E_CHANGED_MODE) {
            throw SourceException(errorFromHresult(hr), "CoInitializeEx failed");
        }

        hr = CoInitializeSecurity(nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
                                  RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);
        if (FAILED(hr) && hr != RPC_E_TOO_LATE) {
            release();
            throw SourceException(errorFromHresult(hr), "CoInitializeSecurity failed");
        }

        ComPtr<IWbemLocator> locator;
        hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER, IID_IWbemLocator,
                              reinterpret_cast<void**>(locator.GetAddressOf()));
        if (FAILED(hr)) {
            release();
            throw SourceException(errorFromHresult(hr), "WbemLocator unavailable");
        }

        hr = locator->ConnectServer(_bstr_t(L"ROOT\\CIMV2"), nullptr, nullptr, nullptr, 0, nullptr, nullptr,
                                    services_.GetAddressOf());
        if (FAILED(hr)) {
            release();
            throw SourceException(errorFromHresult(hr), "ConnectServer(ROOT\\CIMV2) failed");
        }

        hr = CoSetProxyBlanket(services_.Get(), RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr, RPC_C_AUTHN_LEVEL_CALL,
                               RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
        if (FAILED(hr)) {
            release();
            throw SourceException(errorFromHresult(hr), "CoSetProxyBlanket failed");
        }
    }

    ~WmiSession() override { release(); }

    WmiSession(const WmiSession&) = delete;
    WmiSession& operator=(const WmiSession&) = delete;

    std::vector<WmiRow> query(const wchar_t* wql, const std::vector<const wchar_t*>& properties) const {
        ComPtr<IEnumWbemClassObject> enumerator;
        HRESULT hr = services_->ExecQuery(_bstr_t(L"WQL"), _bstr_t(wql),
                                          WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY, nullptr,
                                          enumerator.GetAddressOf());
        if (FAILED(hr)) {
            throw SourceException(errorFromHresult(hr), "WMI query failed: " + fromWide(wql));
        }

        std::vector<WmiRow> rows;
        for (;;) {
            ComPtr<IWbemClassObject> object;
            ULONG returned = 0;
            hr = enumerator->Next(WBEM_INFINITE, 1, object.GetAddressOf(), &returned);
            if (FAILED(hr) || returned == 0) {
                break;
            }

            WmiRow row;
            for (const wchar_t* property : properties) {
                VARIANT value;
                VariantInit(&value);
                if (SUCCEEDED(object->Get(property, 0, &value, nullptr, nullptr))) {
                    row[fromWide(property)] = fromVariant(value);
                }
                VariantClear(&value);
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    void release() {
        services_.Reset();
        if (uninitialize_) {
            CoUninitialize();
            uninitialize_ = false;
        }
    }

    ComPtr<IWbemServices> services_;
    bool uninitialize_ = false;
};

const WmiSession& requireWmi(PlatformSession* session) {
    auto* wmi = dynamic_cast<WmiSession*>(session);
    if (!wmi) {
        throw SourceException(SourceError::SourceUnavailable, "no WMI session");
    }
    return *wmi;
}

std::string field(const WmiRow& row, const char* name) {
    auto it = row.find(name);
    return it == row.end() ? std::string() : it->second.text;
}

std::optional<std::int64_t> number(const WmiRow& row, const char* name) {
    auto it = row.find(name);
    return it == row.end() ? std::nullopt : it->second.number;
}

std::string registryString(const QString& key, const QString& value) {
    QSettings settings(key, QSettings::NativeFormat);
    return settings.value(value).toString().toStdString();
}

DriveType classifyWindowsDrive(const StorageInfo& drive) {
    if (drive.mountLabel.size() < 2 || drive.mountLabel[1] != ':') {
        return DriveType::Unknown;
    }

    const std::wstring volume = L"\\\\.\\" + std::wstring(1, static_cast<wchar_t>(drive.mountLabel[0])) + L":";
    HANDLE handle = CreateFileW(volume.c_str(), 0, FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_EXISTING, 0,
                                nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return DriveType::Unknown;
    }

    DriveType type = DriveType::Unknown;
    DWORD bytes = 0;

    STORAGE_PROPERTY_QUERY adapterQuery{};
    adapterQuery.PropertyId = StorageAdapterProperty;
    adapterQuery.QueryType = PropertyStandardQuery;
    STORAGE_ADAPTER_DESCRIPTOR adapter{};
    if (DeviceIoControl(handle, IOCTL_STORAGE_QUERY_PROPERTY, &adapterQuery, sizeof(adapterQuery), &adapter,
                        sizeof(adapter), &bytes, nullptr) &&
        adapter.BusType == BusTypeNvme) {
        type = DriveType::NVMe;
    }

    if (type == DriveType::Unknown) {
        STORAGE_PROPERTY_QUERY seekQuery{};
        seekQuery.PropertyId = StorageDeviceSeekPenaltyProperty;
        seekQuery.QueryType = PropertyStandardQuery;
        DEVICE_SEEK_PENALTY_DESCRIPTOR seek{};
        if (DeviceIoControl(handle, IOCTL_STORAGE_QUERY_PROPERTY, &seekQuery, sizeof(seekQuery), &seek,
                            sizeof(seek), &bytes, nullptr)) {
            type = seek.IncursSeekPenalty ? DriveType::HDD : DriveType::SSD;
        }
    }

    CloseHandle(handle);
    return type;
}

class WindowsSource : public PlatformSource {
public:
    std::string name() const override { return "windows"; }

    std::unique_ptr<PlatformSession> openSession() const override { return std::make_unique<WmiSession>(); }

    std::vector<Probe<OsInfo>> osProbes(PlatformSession* session) const override {
        return {{"registry", &WindowsSource::readRegistryOs},
                {"Win32_OperatingSystem", [session] { return readWmiOs(requireWmi(session)); }},
                portable::osProbe()};
    }

    std::vector<Probe<CpuInfo>> cpuProbes(PlatformSession* session) const override {
        return {{"Win32_Processor", [session] { return readWmiCpu(requireWmi(session)); }},
                {"processor topology", &WindowsSource::readProcessorTopology},
                portable::cpuThreadsProbe()};
    }

    std::vector<Probe<MemoryReading>> memoryProbes(PlatformSession* session) const override {
        return {{"GlobalMemoryStatusEx", &WindowsSource::readMemoryStatus},
                {"Win32_OperatingSystem", [session] { return readWmiMemory(requireWmi(session)); }}};
    }

    std::vector<Probe<std::vector<GpuReading>>> gpuProbes(PlatformSession* session) const override {
        return {{"Win32_VideoController", [session] { return readWmiGpus(requireWmi(session)); }},
                {"DXGI", &WindowsSource::readDxgiAdapters}};
    }

    std::vector<Probe<std::vector<StorageInfo>>> storageProbes(PlatformSession*) const override {
        return {portable::storageProbe(&classifyWindowsDrive), {"logical drives", &WindowsSource::readLogicalDrives}};
    }

    std::vector<Probe<MotherboardInfo>> motherboardProbes(PlatformSession* session) const override {
        return {{"Win32_BaseBoard", [session] { return readWmiBoard(requireWmi(session)); }},
                {"registry", &WindowsSource::readRegistryBoard}};
    }

    std::vector<Probe<std::string>> hostnameProbes(PlatformSession*) const override {
        return {portable::hostnameProbe(), {"GetComputerNameExW", &WindowsSource::readComputerName}};
    }

private:
    static std::optional<OsInfo> readRegistryOs() {
        const QString key = QStringLiteral("HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion");
        OsInfo info;
        info.name = "Windows";
        info.release = QSysInfo::productVersion().toStdString();
        info.version = QSysInfo::kernelVersion().toStdString();
        info.edition = registryString(key, QStringLiteral("EditionID"));
        info.buildNumber = registryString(key, QStringLiteral("CurrentBuildNumber"));
        info.architecture = QSysInfo::currentCpuArchitecture().toStdString();
        return info;
    }

    static std::optional<OsInfo> readWmiOs(const WmiSession& wmi) {
        const auto rows = wmi.query(L"SELECT Caption, Version, BuildNumber, OSArchitecture FROM Win32_OperatingSystem",
                                    {L"Caption", L"Version", L"BuildNumber", L"OSArchitecture"});
        if (rows.empty()) {
            return std::nullopt;
        }

        OsInfo info;
        info.name = field(rows.front(), "Caption");
        info.version = field(rows.front(), "Version");
        info.buildNumber = field(rows.front(), "BuildNumber");
        info.architecture = field(rows.front(), "OSArchitecture");
        return info;
    }

    static std::optional<CpuInfo> readWmiCpu(const WmiSession& wmi) {
        const auto rows = wmi.query(
            L"SELECT Name, Manufacturer, NumberOfCores, NumberOfLogicalProcessors, MaxClockSpeed FROM Win32_Processor",
            {L"Name", L"Manufacturer", L"NumberOfCores", L"NumberOfLogicalProcessors", L"MaxClockSpeed"});
        if (rows.empty()) {
            return std::nullopt;
        }

        // Multi-socket machines report one row per package.
        CpuInfo info;
        info.model = field(rows.front(), "Name");
        info.manufacturer = cpuVendorName(field(rows.front(), "Manufacturer"));
        for (const auto& row : rows) {
            info.physicalCores += static_cast<unsigned int>(std::max<std::int64_t>(number(row, "NumberOfCores").value_or(0), 0));
            info.logicalThreads +=
                static_cast<unsigned int>(std::max<std::int64_t>(number(row, "NumberOfLogicalProcessors").value_or(0), 0));
        }
        info.clockSpeedGHz = normalizeClockGHz(static_cast<double>(number(rows.front(), "MaxClockSpeed").value_or(0)));
        return info;
    }

    static std::optional<CpuInfo> readProcessorTopology() {
        DWORD length = 0;
        GetLogicalProcessorInformation(nullptr, &length);
        if (GetLastError() != ERROR_INSUFFICIENT_BUFFER || length == 0) {
            throw SourceException(SourceError::SourceUnavailable, "GetLogicalProcessorInformation unavailable");
        }

        std::vector<SYSTEM_LOGICAL_PROCESSOR_INFORMATION> entries(length / sizeof(SYSTEM_LOGICAL_PROCESSOR_INFORMATION));
        if (!GetLogicalProcessorInformation(entries.data(), &length)) {
            throw SourceException(SourceError::SourceUnavailable, "GetLogicalProcessorInformation failed");
        }

        CpuInfo info;
        for (const auto& entry : entries) {
            if (entry.Relationship != RelationProcessorCore) {
                continue;
            }
            ++info.physicalCores;
            ULONG_PTR mask = entry.ProcessorMask;
            while (mask) {
                info.logicalThreads += static_cast<unsigned int>(mask & 1U);
                mask >>= 1;
            }
        }

        const QString key = QStringLiteral("HKEY_LOCAL_MACHINE\\HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0");
        QSettings processor(key, QSettings::NativeFormat);
        info.model = processor.value(QStringLiteral("ProcessorNameString")).toString().toStdString();
        info.manufacturer = cpuVendorName(processor.value(QStringLiteral("VendorIdentifier")).toString().toStdString());
        info.clockSpeedGHz = normalizeClockGHz(processor.value(QStringLiteral("~MHz")).toDouble());
        return info;
    }

    static std::optional<MemoryReading> readMemoryStatus() {
        MEMORYSTATUSEX status{};
        status.dwLength = sizeof(status);
        if (!GlobalMemoryStatusEx(&status)) {
            throw SourceException(SourceError::SourceUnavailable, "GlobalMemoryStatusEx failed");
        }

        MemoryReading reading;
        reading.totalBytes = static_cast<std::int64_t>(status.ullTotalPhys);
        reading.availableBytes = static_cast<std::int64_t>(status.ullAvailPhys);
        return reading;
    }

    static std::optional<MemoryReading> readWmiMemory(const WmiSession& wmi) {
        const auto rows = wmi.query(L"SELECT TotalVisibleMemorySize, FreePhysicalMemory FROM Win32_OperatingSystem",
                                    {L"TotalVisibleMemorySize", L"FreePhysicalMemory"});
        if (rows.empty()) {
            return std::nullopt;
        }

        // Both properties are in KiB.
        MemoryReading reading;
        reading.totalBytes = number(rows.front(), "TotalVisibleMemorySize").value_or(0) * 1024;
        reading.availableBytes = number(rows.front(), "FreePhysicalMemory").value_or(0) * 1024;
        return reading;
    }

    static std::optional<std::vector<GpuReading>> readWmiGpus(const WmiSession& wmi) {
        const auto rows = wmi.query(L"SELECT Name, AdapterCompatibility, AdapterRAM FROM Win32_VideoController",
                                    {L"Name", L"AdapterCompatibility", L"AdapterRAM"});

        std::vector<GpuReading> gpus;
        for (const auto& row : rows) {
            GpuReading gpu;
            gpu.name = field(row, "Name");
            gpu.vendor = field(row, "AdapterCompatibility");
            // AdapterRAM is a signed 32-bit value and goes negative past 2 GiB.
            gpu.vramBytes = number(row, "AdapterRAM");
            gpus.push_back(gpu);
        }
        return gpus;
    }

    static std::optional<std::vector<GpuReading>> readDxgiAdapters() {
        ComPtr<IDXGIFactory1> factory;
        HRESULT hr = CreateDXGIFactory1(__uuidof(IDXGIFactory1), reinterpret_cast<void**>(factory.GetAddressOf()));
        if (FAILED(hr)) {
            throw SourceException(errorFromHresult(hr), "CreateDXGIFactory1 failed");
        }

        std::vector<GpuReading> gpus;
        ComPtr<IDXGIAdapter1> adapter;
        for (UINT index = 0; factory->EnumAdapters1(index, adapter.ReleaseAndGetAddressOf()) != DXGI_ERROR_NOT_FOUND;
             ++index) {
            DXGI_ADAPTER_DESC1 desc{};
            if (FAILED(adapter->GetDesc1(&desc)) || (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE)) {
                continue;
            }

            GpuReading gpu;
            gpu.name = fromWide(desc.Description);
            gpu.vramBytes = static_cast<std::int64_t>(desc.DedicatedVideoMemory);
            switch (desc.VendorId) {
            case 0x10DE:
                gpu.vendor = "NVIDIA";
                break;
            case 0x1002:
                gpu.vendor = "AMD";
                break;
            case 0x8086:
                gpu.vendor = "Intel";
                break;
            default:
                break;
            }
            gpus.push_back(gpu);
        }
        return gpus;
    }

    static std::optional<std::vector<StorageInfo>> readLogicalDrives() {
        const DWORD mask = GetLogicalDrives();
        if (mask == 0) {
            throw SourceException(SourceError::SourceUnavailable, "GetLogicalDrives failed");
        }

        std::vector<StorageInfo> drives;
        for (int letter = 0; letter < 26; ++letter) {
            if (!(mask & (1U << letter))) {
                continue;
            }

            const std::wstring root = std::wstring(1, static_cast<wchar_t>(L'A' + letter)) + L":\\";
            const UINT kind = GetDriveTypeW(root.c_str());
            if (kind != DRIVE_FIXED && kind != DRIVE_REMOVABLE) {
                continue;
            }

            ULARGE_INTEGER freeToCaller{};
            ULARGE_INTEGER total{};
            if (!GetDiskFreeSpaceExW(root.c_str(), &freeToCaller, &total, nullptr)) {
                qCDebug(lcPlatform) << "skipping" << QString::fromStdWString(root) << "error" << GetLastError();
                continue;
            }

            StorageInfo drive;
            drive.mountLabel = fromWide(root.c_str());
            drive.totalBytes = total.QuadPart;
            drive.freeBytes = freeToCaller.QuadPart;
            drive.driveType = classifyWindowsDrive(drive);
            drives.push_back(drive);
        }
        return drives;
    }

    static std::optional<MotherboardInfo> readWmiBoard(const WmiSession& wmi) {
        const auto rows = wmi.query(L"SELECT Manufacturer, Product FROM Win32_BaseBoard", {L"Manufacturer", L"Product"});
        if (rows.empty()) {
            return std::nullopt;
        }

        MotherboardInfo info;
        info.manufacturer = field(rows.front(), "Manufacturer");
        info.model = field(rows.front(), "Product");
        return info;
    }

    static std::optional<MotherboardInfo> readRegistryBoard() {
        const QString key = QStringLiteral("HKEY_LOCAL_MACHINE\\HARDWARE\\DESCRIPTION\\System\\BIOS");
        MotherboardInfo info;
        info.manufacturer = registryString(key, QStringLiteral("BaseBoardManufacturer"));
        info.model = registryString(key, QStringLiteral("BaseBoardProduct"));
        return info;
    }

    static std::optional<std::string> readComputerName() {
        wchar_t buffer[MAX_COMPUTERNAME_LENGTH + 64] = {};
        DWORD size = static_cast<DWORD>(std::size(buffer));
        if (!GetComputerNameExW(ComputerNameDnsHostname, buffer, &size)) {
            throw SourceException(SourceError::SourceUnavailable, "GetComputerNameExW failed");
        }
        return fromWide(buffer);
    }
};

} // namespace

std::unique_ptr<PlatformSource> makeWindowsSource() {
    return std::make_unique<WindowsSource>();
}

} // namespace speccle
