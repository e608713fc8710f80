#include <QtTest/QtTest>

#include <QClipboard>
#include <QGuiApplication>
#include <QLabel>
#include <QPushButton>

#include "fake_platform_source.hpp"
#include "speccle/main_window.hpp"

#include <memory>

using namespace speccle;
using namespace speccle::testing;

namespace {

std::shared_ptr<const HardwareFactCollector> fakeCollector()
{
    auto source = std::make_shared<FakePlatformSource>();
    CpuInfo cpu;
    cpu.model = "Apple M2 Pro";
    cpu.physicalCores = 12;
    cpu.logicalThreads = 12;
    source->cpu = {valueProbe("sysctl", cpu)};
    source->hostname = {valueProbe<std::string>("host", "studio.local")};
    return std::make_shared<const HardwareFactCollector>(source);
}

} // namespace

class MainWindowTests : public QObject
{
    Q_OBJECT
private slots:
    void testReportShownAfterCollection();
    void testCopyPlacesTrimmedReportOnClipboard();
};

void MainWindowTests::testReportShownAfterCollection()
{
    MainWindow window(fakeCollector());
    auto* copyButton = window.findChild<QPushButton*>(QStringLiteral("copyButton"));
    QVERIFY(copyButton != nullptr);

    QTRY_VERIFY_WITH_TIMEOUT(copyButton->isEnabled(), 10000);
    QVERIFY(window.reportText().startsWith(QStringLiteral("OS: ")));
    QVERIFY(window.reportText().contains(QStringLiteral("CPU: Apple M2 Pro")));
    QVERIFY(window.reportText().endsWith(QStringLiteral("Hostname: studio.local")));
}

void MainWindowTests::testCopyPlacesTrimmedReportOnClipboard()
{
    MainWindow window(fakeCollector());
    auto* copyButton = window.findChild<QPushButton*>(QStringLiteral("copyButton"));
    auto* statusLabel = window.findChild<QLabel*>(QStringLiteral("statusLabel"));
    QVERIFY(copyButton != nullptr);
    QVERIFY(statusLabel != nullptr);
    QTRY_VERIFY_WITH_TIMEOUT(copyButton->isEnabled(), 10000);

    QGuiApplication::clipboard()->setText(QStringLiteral("stale"));
    QTest::mouseClick(copyButton, Qt::LeftButton);

    QCOMPARE(QGuiApplication::clipboard()->text(), window.reportText().trimmed());
    QCOMPARE(statusLabel->text(), QStringLiteral("Copied!"));
    QTRY_COMPARE_WITH_TIMEOUT(statusLabel->text(), QString(), 5000);
}

QTEST_MAIN(MainWindowTests)
#include "test_main_window.moc"
