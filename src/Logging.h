/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Logging categories, log folder and the Qt
 *              message handler that mirrors into app.log.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcInstall)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

// ~/YCruncherStressGUI/logs, created on first use.
QString logDirPath();

// Local time formatted for file names: yyyy-MM-dd_hh-mm-ss
QString timestamp();

// Route qDebug/qInfo/qWarning/... into <dir>/app.log (and stderr).
// Returns false if the log file cannot be opened; stderr output still works.
bool installLogHandler(const QString& dir);
