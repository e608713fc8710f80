#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "speccle/linux_parsers.hpp"

using namespace speccle;
using namespace speccle::linux_text;

namespace {

bool writeTopology(const QString& root, const QString& cpu, const QByteArray& package, const QByteArray& core)
{
    const QString dir = root + QStringLiteral("/") + cpu + QStringLiteral("/topology");
    if (!QDir().mkpath(dir)) {
        return false;
    }
    QFile packageFile(dir + QStringLiteral("/physical_package_id"));
    QFile coreFile(dir + QStringLiteral("/core_id"));
    if (!packageFile.open(QIODevice::WriteOnly) || !coreFile.open(QIODevice::WriteOnly)) {
        return false;
    }
    packageFile.write(package + '\n');
    coreFile.write(core + '\n');
    return true;
}

} // namespace

class LinuxParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testCpuInfoSinglePackage();
    void testCpuInfoTwoPackages();
    void testCpuInfoWithoutTopology();
    void testPhysicalCoresWithGapsInCpuNumbering();
    void testPhysicalCoresMissingRoot();
    void testMemInfo();
    void testMemInfoFallsBackToMemFree();
    void testMemInfoWithoutTotal();
    void testOsRelease();
    void testMountsDecodeEscapes();
    void testPciIdsLookup();
    void testPciIdsUnknownDevice();
    void testKnownPciVendor();
    void testBlockDeviceName();
};

void LinuxParserTests::testCpuInfoSinglePackage()
{
    const std::string text =
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz\n"
        "cpu MHz\t\t: 2112.000\n"
        "physical id\t: 0\n"
        "cpu cores\t: 4\n"
        "\n"
        "processor\t: 1\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz\n"
        "cpu MHz\t\t: 800.000\n"
        "physical id\t: 0\n"
        "cpu cores\t: 4\n";

    const CpuInfo cpu = parseCpuInfo(text);
    QCOMPARE(QString::fromStdString(cpu.model), QStringLiteral("Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz"));
    QCOMPARE(QString::fromStdString(cpu.manufacturer), QStringLiteral("Intel"));
    QCOMPARE(cpu.logicalThreads, 2u);
    QCOMPARE(cpu.physicalCores, 4u);
    QCOMPARE(cpu.clockSpeedGHz, 2.112);
}

void LinuxParserTests::testCpuInfoTwoPackages()
{
    const std::string text =
        "processor\t: 0\nvendor_id\t: AuthenticAMD\nphysical id\t: 0\ncpu cores\t: 8\n\n"
        "processor\t: 1\nvendor_id\t: AuthenticAMD\nphysical id\t: 0\ncpu cores\t: 8\n\n"
        "processor\t: 2\nvendor_id\t: AuthenticAMD\nphysical id\t: 1\ncpu cores\t: 8\n\n"
        "processor\t: 3\nvendor_id\t: AuthenticAMD\nphysical id\t: 1\ncpu cores\t: 8\n";

    const CpuInfo cpu = parseCpuInfo(text);
    QCOMPARE(cpu.logicalThreads, 4u);
    QCOMPARE(cpu.physicalCores, 16u);
    QCOMPARE(QString::fromStdString(cpu.manufacturer), QStringLiteral("AMD"));
    QCOMPARE(QString::fromStdString(cpu.model), QStringLiteral("Unknown"));
    QCOMPARE(cpu.clockSpeedGHz, 0.0);
}

void LinuxParserTests::testCpuInfoWithoutTopology()
{
    // ARM kernels report neither model name nor core counts.
    const std::string text =
        "processor\t: 0\nBogoMIPS\t: 108.00\nCPU implementer\t: 0x41\n\n"
        "processor\t: 1\nBogoMIPS\t: 108.00\nCPU implementer\t: 0x41\n";

    const CpuInfo cpu = parseCpuInfo(text);
    QCOMPARE(cpu.logicalThreads, 2u);
    QCOMPARE(cpu.physicalCores, 0u);
    QVERIFY(isUnknown(cpu.model));
}

void LinuxParserTests::testPhysicalCoresWithGapsInCpuNumbering()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());

    // cpu1 is offline and cpu3 is an SMT sibling of cpu2.
    QVERIFY(writeTopology(root.path(), QStringLiteral("cpu0"), "0", "0"));
    QVERIFY(QDir().mkpath(root.path() + QStringLiteral("/cpu1")));
    QVERIFY(writeTopology(root.path(), QStringLiteral("cpu2"), "0", "1"));
    QVERIFY(writeTopology(root.path(), QStringLiteral("cpu3"), "0", "1"));
    QVERIFY(writeTopology(root.path(), QStringLiteral("cpu8"), "1", "0"));
    QVERIFY(writeTopology(root.path(), QStringLiteral("cpufreq"), "9", "9"));

    QCOMPARE(countPhysicalCores(root.path().toStdString()), 3u);
}

void LinuxParserTests::testPhysicalCoresMissingRoot()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    QCOMPARE(countPhysicalCores((root.path() + QStringLiteral("/absent")).toStdString()), 0u);
}

void LinuxParserTests::testMemInfo()
{
    const auto reading = parseMemInfo(
        "MemTotal:       16314348 kB\n"
        "MemFree:         1234567 kB\n"
        "MemAvailable:    9876543 kB\n"
        "Buffers:          123456 kB\n");

    QVERIFY(reading.has_value());
    QCOMPARE(reading->totalBytes, std::int64_t(16314348) * 1024);
    QCOMPARE(reading->availableBytes, std::int64_t(9876543) * 1024);
}

void LinuxParserTests::testMemInfoFallsBackToMemFree()
{
    const auto reading = parseMemInfo("MemTotal: 2048 kB\nMemFree: 1024 kB\n");

    QVERIFY(reading.has_value());
    QCOMPARE(reading->availableBytes, std::int64_t(1024) * 1024);
}

void LinuxParserTests::testMemInfoWithoutTotal()
{
    QVERIFY(!parseMemInfo("MemFree: 1024 kB\n").has_value());
    QVERIFY(!parseMemInfo("").has_value());
}

void LinuxParserTests::testOsRelease()
{
    const auto values = parseOsRelease(
        "# comment\n"
        "NAME=\"Arch Linux\"\n"
        "PRETTY_NAME='Arch Linux'\n"
        "ID=arch\n"
        "BUILD_ID=rolling\n");

    QCOMPARE(QString::fromStdString(values.at("NAME")), QStringLiteral("Arch Linux"));
    QCOMPARE(QString::fromStdString(values.at("PRETTY_NAME")), QStringLiteral("Arch Linux"));
    QCOMPARE(QString::fromStdString(values.at("ID")), QStringLiteral("arch"));
    QVERIFY(values.find("# comment") == values.end());
}

void LinuxParserTests::testMountsDecodeEscapes()
{
    const auto mounts = parseMounts(
        "/dev/nvme0n1p2 / ext4 rw,relatime 0 0\n"
        "/dev/sdb1 /media/user/My\\040Drive vfat rw 0 0\n"
        "broken-line\n");

    QCOMPARE(mounts.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(mounts[0].device), QStringLiteral("/dev/nvme0n1p2"));
    QCOMPARE(QString::fromStdString(mounts[0].fsType), QStringLiteral("ext4"));
    QCOMPARE(QString::fromStdString(mounts[1].mountPoint), QStringLiteral("/media/user/My Drive"));
}

void LinuxParserTests::testPciIdsLookup()
{
    const std::string pciIds =
        "# pci.ids excerpt\n"
        "1002  Advanced Micro Devices, Inc. [AMD/ATI]\n"
        "\t744c  Navi 31 [Radeon RX 7900 XT/7900 XTX]\n"
        "10de  NVIDIA Corporation\n"
        "\t2684  AD102 [GeForce RTX 4090]\n"
        "\t\t1043 889d  ROG Strix\n"
        "\t2704  AD103 [GeForce RTX 4080]\n"
        "8086  Intel Corporation\n"
        "C 00  Unclassified device\n";

    const PciNames nvidia = lookupPciIds(pciIds, "0x10de", "0x2704");
    QCOMPARE(QString::fromStdString(nvidia.vendor), QStringLiteral("NVIDIA Corporation"));
    QCOMPARE(QString::fromStdString(nvidia.device), QStringLiteral("AD103 [GeForce RTX 4080]"));

    const PciNames amd = lookupPciIds(pciIds, "1002", "744C");
    QCOMPARE(QString::fromStdString(amd.device), QStringLiteral("Navi 31 [Radeon RX 7900 XT/7900 XTX]"));
}

void LinuxParserTests::testPciIdsUnknownDevice()
{
    const std::string pciIds =
        "10de  NVIDIA Corporation\n"
        "\t2684  AD102 [GeForce RTX 4090]\n"
        "8086  Intel Corporation\n";

    const PciNames names = lookupPciIds(pciIds, "10de", "ffff");
    QCOMPARE(QString::fromStdString(names.vendor), QStringLiteral("NVIDIA Corporation"));
    QVERIFY(names.device.empty());

    QVERIFY(lookupPciIds(pciIds, "1234", "1111").vendor.empty());
}

void LinuxParserTests::testKnownPciVendor()
{
    QCOMPARE(QString::fromStdString(knownPciVendor("0x10de")), QStringLiteral("NVIDIA"));
    QCOMPARE(QString::fromStdString(knownPciVendor("1002")), QStringLiteral("AMD"));
    QCOMPARE(QString::fromStdString(knownPciVendor("0x8086")), QStringLiteral("Intel"));
    QVERIFY(knownPciVendor("0xabcd").empty());
}

void LinuxParserTests::testBlockDeviceName()
{
    QCOMPARE(QString::fromStdString(blockDeviceName("/dev/nvme0n1p2")), QStringLiteral("nvme0n1p2"));
    QCOMPARE(QString::fromStdString(blockDeviceName("/dev/mapper/root")), QStringLiteral("root"));
    QVERIFY(blockDeviceName("tmpfs").empty());
}

QTEST_MAIN(LinuxParserTests)
#include "test_linux_parsers.moc"
