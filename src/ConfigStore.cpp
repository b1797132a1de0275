/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: INI persistence of the selected tests and
 *              the last used durations.
 * License: MIT
 * **********************************************************/

#include "ConfigStore.h"
#include "Logging.h"
#include "TestSelection.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

// -----------------------------
// value helpers
// -----------------------------

static std::optional<int> readSeconds(const QSettings& s, const QString& key, int max, bool* ok) {
    const QString v = s.value(key, "Auto").toString().trimmed();
    if (v.isEmpty() || v.compare("auto", Qt::CaseInsensitive) == 0) return std::nullopt;
    bool isInt = false;
    const int n = v.toInt(&isInt);
    if (!isInt || n <= 0 || n > max) { *ok = false; return std::nullopt; }
    return n;
}

static QString writeSeconds(const std::optional<int>& v) {
    return v ? QString::number(*v) : QStringLiteral("Auto");
}

static bool readBool(const QString& v, bool* ok) {
    const QString t = v.trimmed().toLower();
    if (t == "true" || t == "1" || t == "yes" || t == "on")  return true;
    if (t == "false" || t == "0" || t == "no" || t == "off") return false;
    *ok = false;
    return false;
}

// -----------------------------
// ConfigStore
// -----------------------------

ConfigStore::ConfigStore(const QString& path)
    : m_path(path)
{
}

QString ConfigStore::defaultPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty()) dir = QDir::homePath() + "/.config/ycruncher-gui";
    return dir + "/ycruncher-gui.ini";
}

PersistedConfig ConfigStore::load() const {
    PersistedConfig defaults;

    QFileInfo fi(m_path);
    if (!fi.exists()) {
        qCInfo(lcConfig) << "No configuration at" << m_path << "- using defaults";
        return defaults;
    }
    if (!fi.isReadable()) {
        qCWarning(lcConfig) << "Configuration not readable:" << m_path << "- using defaults";
        return defaults;
    }

    QSettings s(m_path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        qCWarning(lcConfig) << "Malformed configuration" << m_path << "- using defaults";
        return defaults;
    }

    PersistedConfig cfg;
    bool ok = true;

    s.beginGroup("Configuration");
    cfg.timeLimit = readSeconds(s, "time_limit", TestSelection::MaxTimeLimit, &ok);
    cfg.perTest   = readSeconds(s, "duration_per_test", TestSelection::MaxPerTestDuration, &ok);
    const QString mem = s.value("memory", "Auto").toString().trimmed();
    cfg.memory = mem.compare("auto", Qt::CaseInsensitive) == 0 ? QString() : mem;
    cfg.executable = s.value("executable").toString().trimmed();
    s.endGroup();

    s.beginGroup("Components");
    for (const QString& key : s.childKeys()) {
        bool valueOk = true;
        const bool on = readBool(s.value(key).toString(), &valueOk);
        if (!valueOk) { ok = false; break; }
        cfg.tests.insert(key, on);
    }
    s.endGroup();

    if (!ok) {
        qCWarning(lcConfig) << "Invalid values in" << m_path << "- using defaults";
        return defaults;
    }
    qCInfo(lcConfig) << "Loaded configuration from" << m_path;
    return cfg;
}

bool ConfigStore::save(const PersistedConfig& cfg, QString* error) const {
    auto fail = [&](const QString& why) {
        qCWarning(lcConfig) << "Saving configuration failed:" << why;
        if (error) *error = why;
        return false;
    };

    const QFileInfo fi(m_path);
    if (!QDir().mkpath(fi.absolutePath()))
        return fail("cannot create " + fi.absolutePath());

    {
        QSettings s(m_path, QSettings::IniFormat);
        s.setAtomicSyncRequired(true);  // temp file + rename, never a partial write
        s.clear();

        s.beginGroup("Configuration");
        s.setValue("time_limit", writeSeconds(cfg.timeLimit));
        s.setValue("duration_per_test", writeSeconds(cfg.perTest));
        s.setValue("memory", cfg.memory.isEmpty() ? QStringLiteral("Auto") : cfg.memory);
        s.setValue("executable", cfg.executable);
        s.endGroup();

        s.beginGroup("Components");
        for (auto it = cfg.tests.constBegin(); it != cfg.tests.constEnd(); ++it)
            s.setValue(it.key(), it.value() ? "true" : "false");
        s.endGroup();

        s.sync();
        if (s.status() != QSettings::NoError)
            return fail("cannot write " + m_path);
    }

    qCInfo(lcConfig) << "Saved configuration to" << m_path;
    return true;
}
