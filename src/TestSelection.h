/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: The user's test selection and duration
 *              settings, and the RunConfig derived from them.
 * License: MIT
 * **********************************************************/

#pragma once

#include "TestCatalog.h"

#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

struct PersistedConfig;

// Everything a single y-cruncher stress run needs.
struct RunConfig {
    QStringList tests;            // catalog order
    int         timeLimitSeconds = 0;
    int         perTestSeconds = 0;
    QString     memory;           // empty = let y-cruncher decide
};

class TestSelection {
public:
    static constexpr int AutoTimeLimitPerTest = 1800;
    static constexpr int DefaultPerTestDuration = 120;
    static constexpr int MaxPerTestDuration = 86400;      // one day per component
    static constexpr int MaxTimeLimit = 30 * 86400;

    explicit TestSelection(const TestCatalog& catalog);

    const TestCatalog& catalog() const { return m_catalog; }

    // --- selection ---
    bool setSelected(const QString& id, bool on);
    bool isSelected(const QString& id) const { return m_selected.contains(id); }
    void selectAll();
    void deselectAll();
    void applyPreset(PresetKind kind);
    QStringList selectedIds() const;
    int count() const { return m_selected.size(); }

    // --- time limit (-TL) ---
    // nullopt switches back to Auto. Values outside 1..MaxTimeLimit are rejected.
    bool setTimeLimit(std::optional<int> seconds);
    bool isTimeLimitManual() const { return m_timeLimit.has_value(); }
    std::optional<int> manualTimeLimit() const { return m_timeLimit; }
    int timeLimitSeconds() const;
    int minimumTimeLimit() const { return perTestSeconds() * count(); }
    bool timeLimitCorrected() const;

    // --- per test duration (-D) ---
    // Values outside 1..MaxPerTestDuration are rejected.
    bool setPerTestDuration(std::optional<int> seconds);
    std::optional<int> manualPerTestDuration() const { return m_perTest; }
    int perTestSeconds() const { return m_perTest.value_or(DefaultPerTestDuration); }

    // --- memory (-M) ---
    bool setMemory(const QString& memory);
    QString memory() const { return m_memory; }
    static bool isValidMemory(const QString& memory);

    RunConfig runConfig() const;

    PersistedConfig toPersisted() const;
    void applyPersisted(const PersistedConfig& cfg);

private:
    const TestCatalog& m_catalog;
    QSet<QString>      m_selected;
    std::optional<int> m_timeLimit;
    std::optional<int> m_perTest;
    QString            m_memory;
};
