/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Finds the y-cruncher executable.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QString>
#include <QStringList>
#include <optional>

bool which(const QString& exe, QString* outPath = nullptr);

class BinaryLocator {
public:
    static constexpr const char* ExecutableName = "y-cruncher";

    // Directories searched before PATH. Defaults to the application
    // directory, the current directory and the download location.
    explicit BinaryLocator(QStringList searchDirs = defaultSearchDirs());

    // preferred (if usable), then <dir>/y-cruncher and <dir>/y-cruncher*/y-cruncher
    // for every search dir, then PATH.
    std::optional<QString> locate(const QString& preferred = QString()) const;

    static bool isUsable(const QString& path);
    static QStringList defaultSearchDirs();

private:
    QStringList m_searchDirs;
};
