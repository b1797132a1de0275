/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Logging categories, log folder and the Qt
 *              message handler that mirrors into app.log.
 * License: MIT
 * **********************************************************/

#include "Logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

Q_LOGGING_CATEGORY(lcSession, "ycgui.session")
Q_LOGGING_CATEGORY(lcConfig,  "ycgui.config")
Q_LOGGING_CATEGORY(lcInstall, "ycgui.install")
Q_LOGGING_CATEGORY(lcUi,      "ycgui.ui")

// -----------------------------
// util
// -----------------------------

QString logDirPath() {
    QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
    QDir d(home + "/YCruncherStressGUI/logs");
    if (!d.exists()) d.mkpath(".");
    return d.absolutePath();
}

QString timestamp() {
    return QDateTime::currentDateTime().toString("yyyy-MM-dd_hh-mm-ss");
}

// -----------------------------
// message handler
// -----------------------------

namespace {

QMutex gLogMutex;
QFile  gLogFile;

const char* levelToText(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARN";
    case QtCriticalMsg: return "CRIT";
    case QtFatalMsg:    return "FATAL";
    }
    return "UNKNOWN";
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("qt");
    const QString line = QStringLiteral("%1 [%2] [%3] %4")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                                  QString::fromUtf8(levelToText(type)),
                                  category,
                                  msg);
    {
        QMutexLocker locker(&gLogMutex);
        if (gLogFile.isOpen()) {
            QTextStream ts(&gLogFile);
            ts << line << '\n';
            ts.flush();
        }
    }
    std::fprintf(stderr, "%s\n", qPrintable(line));

    if (type == QtFatalMsg) std::abort();
}

} // namespace

bool installLogHandler(const QString& dir) {
    bool ok = false;
    {
        QMutexLocker locker(&gLogMutex);
        if (gLogFile.isOpen()) gLogFile.close();
        gLogFile.setFileName(QDir(dir).filePath("app.log"));
        ok = gLogFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }
    qInstallMessageHandler(messageHandler);
    return ok;
}
