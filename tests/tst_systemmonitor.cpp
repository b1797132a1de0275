/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: /proc/stat and /proc/meminfo parsing.
 * License: MIT
 * **********************************************************/

#include "SystemMonitor.h"

#include <QTest>

class SystemMonitorTest : public QObject {
    Q_OBJECT
private slots:
    void parsesCpuLine();
    void rejectsNonCpuLine();
    void cpuPercentFromDeltas();
    void cpuPercentCounterReset();
    void parsesMemInfo();
    void memPercentEmpty();
    void firstSampleIsZero();
};

void SystemMonitorTest::parsesCpuLine() {
    const QString stat = "cpu  100 5 50 800 20 3 2 0 0 0\ncpu0 50 2 25 400 10 1 1 0 0 0\n";
    auto s = SystemMonitor::parseCpuLine(stat);
    QVERIFY(s.has_value());
    QCOMPARE(s->user, quint64(100));
    QCOMPARE(s->idle, quint64(800));
    QCOMPARE(s->idleTime(), quint64(820));
    QCOMPARE(s->busyTime(), quint64(160));
}

void SystemMonitorTest::rejectsNonCpuLine() {
    QVERIFY(!SystemMonitor::parseCpuLine("intr 12345 0 0").has_value());
    QVERIFY(!SystemMonitor::parseCpuLine(QString()).has_value());
}

void SystemMonitorTest::cpuPercentFromDeltas() {
    CpuSnapshot a; a.user = 100; a.idle = 900;
    CpuSnapshot b; b.user = 175; b.idle = 925;
    QCOMPARE(SystemMonitor::cpuPercent(a, b), 75.0);
    QCOMPARE(SystemMonitor::cpuPercent(a, a), 0.0);
}

void SystemMonitorTest::cpuPercentCounterReset() {
    CpuSnapshot a; a.user = 500; a.idle = 900;
    CpuSnapshot b; b.user = 10;  b.idle = 20;
    QCOMPARE(SystemMonitor::cpuPercent(a, b), 0.0);
}

void SystemMonitorTest::parsesMemInfo() {
    const QString text =
        "MemTotal:       16384000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    4096000 kB\n"
        "Buffers:          200000 kB\n";
    const MemInfo m = SystemMonitor::parseMemInfo(text);
    QCOMPARE(m.totalKiB, qulonglong(16384000));
    QCOMPARE(m.availableKiB, qulonglong(4096000));
    QCOMPARE(SystemMonitor::memPercent(m), 75.0);
}

void SystemMonitorTest::memPercentEmpty() {
    QCOMPARE(SystemMonitor::memPercent(MemInfo()), 0.0);
    const MemInfo m = SystemMonitor::parseMemInfo("garbage\n");
    QCOMPARE(m.totalKiB, qulonglong(0));
}

void SystemMonitorTest::firstSampleIsZero() {
    SystemMonitor mon;
    QCOMPARE(mon.sampleCpu(), 0.0);
    const double second = mon.sampleCpu();
    QVERIFY(second >= 0.0 && second <= 100.0);
}

QTEST_GUILESS_MAIN(SystemMonitorTest)
#include "tst_systemmonitor.moc"
