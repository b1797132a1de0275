/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Static table of y-cruncher stress sub-tests
 *              and the RAM-intensity presets built on it.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QSet>
#include <QString>
#include <QVector>

enum class LoadLevel { None, Low, Medium, High };

struct TestDefinition {
    QString   id;            // y-cruncher component tag, e.g. "FFTv4"
    QString   displayName;
    LoadLevel cpuLoad = LoadLevel::None;
    LoadLevel ramLoad = LoadLevel::None;
    double    ramIntensity = 0.0;   // 0 = pure CPU, 1 = pure memory
};

enum class PresetKind { Cpu, CpuRam, Ram };

struct Preset {
    PresetKind kind;
    QString    name;
    QString    description;
    double     minRamIntensity = 0.0;
    double     maxRamIntensity = 1.0;
};

class TestCatalog {
public:
    TestCatalog();

    const QVector<TestDefinition>& tests() const { return m_tests; }
    const QVector<Preset>& presets() const { return m_presets; }

    const TestDefinition* find(const QString& id) const;
    bool contains(const QString& id) const { return find(id) != nullptr; }

    const Preset& preset(PresetKind kind) const;
    QSet<QString> computePreset(PresetKind kind) const;

    // "CPU [───●──────] MEM"
    static QString loadBar(const TestDefinition& t);
    static QString loadLevelName(LoadLevel l);

private:
    QVector<TestDefinition> m_tests;
    QVector<Preset>         m_presets;
};
