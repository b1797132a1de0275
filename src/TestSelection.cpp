/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: The user's test selection and duration
 *              settings, and the RunConfig derived from them.
 * License: MIT
 * **********************************************************/

#include "TestSelection.h"
#include "ConfigStore.h"

#include <QRegularExpression>
#include <algorithm>

TestSelection::TestSelection(const TestCatalog& catalog)
    : m_catalog(catalog)
{
}

// --- selection ---

bool TestSelection::setSelected(const QString& id, bool on) {
    if (!m_catalog.contains(id)) return false;
    if (on) m_selected.insert(id);
    else    m_selected.remove(id);
    return true;
}

void TestSelection::selectAll() {
    for (const auto& t : m_catalog.tests()) m_selected.insert(t.id);
}

void TestSelection::deselectAll() {
    m_selected.clear();
    m_timeLimit.reset();    // nothing selected: Auto, i.e. 0 seconds
}

void TestSelection::applyPreset(PresetKind kind) {
    m_selected = m_catalog.computePreset(kind);
}

QStringList TestSelection::selectedIds() const {
    QStringList ids;
    for (const auto& t : m_catalog.tests())
        if (m_selected.contains(t.id)) ids << t.id;
    return ids;
}

// --- durations ---

bool TestSelection::setTimeLimit(std::optional<int> seconds) {
    if (seconds && (*seconds <= 0 || *seconds > MaxTimeLimit)) return false;
    m_timeLimit = seconds;
    return true;
}

int TestSelection::timeLimitSeconds() const {
    if (!m_timeLimit) return AutoTimeLimitPerTest * count();
    return std::max(*m_timeLimit, minimumTimeLimit());
}

bool TestSelection::timeLimitCorrected() const {
    return m_timeLimit && *m_timeLimit < minimumTimeLimit();
}

bool TestSelection::setPerTestDuration(std::optional<int> seconds) {
    if (seconds && (*seconds <= 0 || *seconds > MaxPerTestDuration)) return false;
    m_perTest = seconds;
    return true;
}

bool TestSelection::isValidMemory(const QString& memory) {
    const QString m = memory.trimmed();
    if (m.isEmpty() || m.compare("auto", Qt::CaseInsensitive) == 0) return true;
    static const QRegularExpression re("^\\d+(\\.\\d+)?[KMGT]?$",
                                       QRegularExpression::CaseInsensitiveOption);
    return re.match(m).hasMatch();
}

bool TestSelection::setMemory(const QString& memory) {
    if (!isValidMemory(memory)) return false;
    const QString m = memory.trimmed();
    m_memory = (m.compare("auto", Qt::CaseInsensitive) == 0) ? QString() : m.toUpper();
    return true;
}

RunConfig TestSelection::runConfig() const {
    RunConfig rc;
    rc.tests = selectedIds();
    rc.timeLimitSeconds = timeLimitSeconds();
    rc.perTestSeconds = perTestSeconds();
    rc.memory = m_memory;
    return rc;
}

// --- persistence ---

PersistedConfig TestSelection::toPersisted() const {
    PersistedConfig cfg;
    for (const auto& t : m_catalog.tests())
        cfg.tests.insert(t.id, m_selected.contains(t.id));
    cfg.timeLimit = m_timeLimit;
    cfg.perTest = m_perTest;
    cfg.memory = m_memory;
    return cfg;
}

void TestSelection::applyPersisted(const PersistedConfig& cfg) {
    m_selected.clear();
    for (auto it = cfg.tests.constBegin(); it != cfg.tests.constEnd(); ++it)
        if (it.value()) setSelected(it.key(), true);   // unknown ids are dropped
    if (!setTimeLimit(cfg.timeLimit)) m_timeLimit.reset();
    if (!setPerTestDuration(cfg.perTest)) m_perTest.reset();
    if (!setMemory(cfg.memory)) m_memory.clear();
}
