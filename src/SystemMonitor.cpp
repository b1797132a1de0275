/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Lightweight CPU / memory load sampling from
 *              /proc for the dashboard gauges (Linux).
 * License: MIT
 * **********************************************************/

#include "SystemMonitor.h"

#include <QFile>
#include <QHash>
#include <QRegularExpression>
#include <QStringList>
#include <QTextStream>

#include <algorithm>

std::optional<CpuSnapshot> SystemMonitor::parseCpuLine(const QString& text) {
    QString line = text.section('\n', 0, 0);
    QTextStream ts(&line);
    QString cpu; ts >> cpu; if (cpu != "cpu") return std::nullopt;
    CpuSnapshot s;
    ts >> s.user >> s.nice >> s.sys >> s.idle >> s.iowait >> s.irq >> s.softirq >> s.steal >> s.guest >> s.guest_nice;
    if (ts.status() == QTextStream::ReadCorruptData) return std::nullopt;
    return s;
}

double SystemMonitor::cpuPercent(const CpuSnapshot& prev, const CpuSnapshot& now) {
    if (now.idleTime() < prev.idleTime() || now.busyTime() < prev.busyTime()) return 0.0;
    auto deltaIdle = now.idleTime() - prev.idleTime();
    auto deltaNon  = now.busyTime() - prev.busyTime();
    auto total = deltaIdle + deltaNon;
    if (total == 0) return 0.0;
    return (double(deltaNon) / double(total)) * 100.0;
}

MemInfo SystemMonitor::parseMemInfo(const QString& text) {
    QHash<QString,qulonglong> map;
    static const QRegularExpression ws("\\s+");
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        auto parts = line.split(ws, Qt::SkipEmptyParts);
        if (parts.size() >= 2) {
            bool ok=false;
            qulonglong kB = parts[1].toULongLong(&ok);
            if (ok) map[parts[0].remove(':')] = kB; // store in kB
        }
    }
    MemInfo m;
    m.totalKiB = map.value("MemTotal",0);
    m.availableKiB = std::min(map.value("MemAvailable",0), m.totalKiB);
    return m;
}

double SystemMonitor::memPercent(const MemInfo& m) {
    if (m.totalKiB == 0) return 0.0;
    return double(m.totalKiB - m.availableKiB) / double(m.totalKiB) * 100.0;
}

double SystemMonitor::sampleCpu() {
    QFile f("/proc/stat");
    if (!f.open(QIODevice::ReadOnly|QIODevice::Text)) return 0.0;
    auto now = parseCpuLine(QString::fromLatin1(f.readLine()));
    if (!now) return 0.0;
    double pct = m_prev ? cpuPercent(*m_prev, *now) : 0.0;
    m_prev = now;
    return pct;
}

MemInfo SystemMonitor::sampleMemory() const {
    QFile f("/proc/meminfo");
    if (!f.open(QIODevice::ReadOnly|QIODevice::Text)) return {};
    return parseMemInfo(QString::fromLatin1(f.readAll()));
}
