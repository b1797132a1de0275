/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Lightweight CPU / memory load sampling from
 *              /proc for the dashboard gauges (Linux).
 * License: MIT
 * **********************************************************/

#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

struct CpuSnapshot {
    quint64 user=0,nice=0,sys=0,idle=0,iowait=0,irq=0,softirq=0,steal=0,guest=0,guest_nice=0;

    quint64 idleTime() const { return idle + iowait; }
    quint64 busyTime() const { return user + nice + sys + irq + softirq + steal; }
};

struct MemInfo {
    qulonglong totalKiB = 0;
    qulonglong availableKiB = 0;

    double usedGiB() const  { return (totalKiB - availableKiB) / 1024.0 / 1024.0; }
    double totalGiB() const { return totalKiB / 1024.0 / 1024.0; }
};

class SystemMonitor {
public:
    // First "cpu" line of /proc/stat.
    static std::optional<CpuSnapshot> parseCpuLine(const QString& text);
    // Busy share between two snapshots, in percent.
    static double cpuPercent(const CpuSnapshot& prev, const CpuSnapshot& now);

    static MemInfo parseMemInfo(const QString& text);
    static double memPercent(const MemInfo& m);

    // Reads /proc; the first CPU sample after construction reports 0.
    double sampleCpu();
    MemInfo sampleMemory() const;

private:
    std::optional<CpuSnapshot> m_prev;
};
