/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: INI persistence of the selected tests and
 *              the last used durations.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QMap>
#include <QString>
#include <optional>

struct PersistedConfig {
    QMap<QString, bool> tests;       // id -> selected
    std::optional<int>  timeLimit;   // nullopt = Auto
    std::optional<int>  perTest;     // nullopt = Auto
    QString             memory;      // empty = Auto
    QString             executable;  // empty = search

    bool operator==(const PersistedConfig& o) const {
        return tests == o.tests && timeLimit == o.timeLimit && perTest == o.perTest
            && memory == o.memory && executable == o.executable;
    }
    bool operator!=(const PersistedConfig& o) const { return !(*this == o); }
};

class ConfigStore {
public:
    explicit ConfigStore(const QString& path = defaultPath());

    const QString& path() const { return m_path; }

    // Never fails: a missing or unreadable file yields a default config.
    PersistedConfig load() const;

    // Replaces the file atomically; the previous file survives a failed write.
    bool save(const PersistedConfig& cfg, QString* error = nullptr) const;

    static QString defaultPath();

private:
    QString m_path;
};
