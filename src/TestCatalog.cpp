/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Static table of y-cruncher stress sub-tests
 *              and the RAM-intensity presets built on it.
 * License: MIT
 * **********************************************************/

#include "TestCatalog.h"

#include <algorithm>

// -----------------------------
// Component table
// -----------------------------
// ramIntensity values and preset ranges are empirical; keep them as data.

TestCatalog::TestCatalog()
    : m_tests{
        {"BKT",   "Scalar Integer", LoadLevel::High,   LoadLevel::Low,    0.2},
        {"BBP",   "AVX2 Float",     LoadLevel::High,   LoadLevel::Low,    0.1},
        {"SFTv4", "AVX2 Float",     LoadLevel::High,   LoadLevel::Low,    0.2},
        {"SNT",   "AVX2 Integer",   LoadLevel::High,   LoadLevel::Low,    0.3},
        {"SVT",   "AVX2 Float",     LoadLevel::High,   LoadLevel::Low,    0.3},
        {"FFTv4", "AVX2 Float",     LoadLevel::Medium, LoadLevel::High,   0.9},
        {"N63",   "AVX2 Integer",   LoadLevel::High,   LoadLevel::Medium, 0.4},
        {"VT3",   "AVX2 Float",     LoadLevel::High,   LoadLevel::Medium, 0.5},
      },
      m_presets{
        {PresetKind::Cpu,    "CPU",     "CPU-focused tests",                   0.0, 0.3},
        {PresetKind::CpuRam, "CPU+RAM", "IMC/SA/FCLK/signaling-focused tests", 0.4, 0.7},
        {PresetKind::Ram,    "RAM",     "RAM-focused tests",                   0.8, 1.0},
      }
{
}

const TestDefinition* TestCatalog::find(const QString& id) const {
    auto it = std::find_if(m_tests.begin(), m_tests.end(),
                           [&id](const TestDefinition& t){ return t.id == id; });
    return it == m_tests.end() ? nullptr : &*it;
}

const Preset& TestCatalog::preset(PresetKind kind) const {
    for (const auto& p : m_presets)
        if (p.kind == kind) return p;
    return m_presets.front();
}

QSet<QString> TestCatalog::computePreset(PresetKind kind) const {
    const Preset& p = preset(kind);
    QSet<QString> ids;
    for (const auto& t : m_tests) {
        if (t.ramIntensity >= p.minRamIntensity && t.ramIntensity <= p.maxRamIntensity)
            ids.insert(t.id);
    }
    return ids;
}

QString TestCatalog::loadBar(const TestDefinition& t) {
    const int len = 10;
    const int dot = std::clamp(int(t.ramIntensity * len), 0, len - 1);
    QString line(len, QChar(0x2500));   // ─
    line[dot] = QChar(0x25CF);          // ●
    return QString("CPU [%1] MEM").arg(line);
}

QString TestCatalog::loadLevelName(LoadLevel l) {
    switch (l) {
    case LoadLevel::None:   return "none";
    case LoadLevel::Low:    return "low";
    case LoadLevel::Medium: return "medium";
    case LoadLevel::High:   return "high";
    }
    return "none";
}
