/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Finds the y-cruncher executable.
 * License: MIT
 * **********************************************************/

#include "BinaryLocator.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

bool which(const QString& exe, QString* outPath) {
    const QString path = QStandardPaths::findExecutable(exe);
    bool ok = !path.isEmpty();
    if (ok && outPath) *outPath = path;
    return ok;
}

BinaryLocator::BinaryLocator(QStringList searchDirs)
    : m_searchDirs(std::move(searchDirs))
{
}

QStringList BinaryLocator::defaultSearchDirs() {
    QStringList dirs;
    if (QCoreApplication::instance()) dirs << QCoreApplication::applicationDirPath();
    dirs << QDir::currentPath();
    // where BinaryInstaller unpacks downloads
    const QString data = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!data.isEmpty()) dirs << data;
    dirs.removeDuplicates();
    return dirs;
}

bool BinaryLocator::isUsable(const QString& path) {
    if (path.isEmpty()) return false;
    QFileInfo fi(path);
    return fi.exists() && fi.isFile() && fi.isExecutable();
}

std::optional<QString> BinaryLocator::locate(const QString& preferred) const {
    if (isUsable(preferred)) return QFileInfo(preferred).absoluteFilePath();

    for (const QString& dirPath : m_searchDirs) {
        QDir dir(dirPath);
        const QString direct = dir.filePath(ExecutableName);
        if (isUsable(direct)) return QFileInfo(direct).absoluteFilePath();

        // unpacked release folders, e.g. "y-cruncher v0.8.6.9545-static/"
        const auto subdirs = dir.entryInfoList({"y-cruncher*"}, QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
        for (const QFileInfo& sub : subdirs) {
            const QString nested = QDir(sub.absoluteFilePath()).filePath(ExecutableName);
            if (isUsable(nested)) return QFileInfo(nested).absoluteFilePath();
        }
    }

    QString p;
    if (which(ExecutableName, &p)) return p;
    return std::nullopt;
}
