/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Per-run transcript: command line, console
 *              output and exit status of one stress run.
 * License: MIT
 * **********************************************************/

#include "RunLog.h"
#include "AppInfo.h"
#include "Logging.h"

#include <QDateTime>
#include <QDir>
#include <QTextStream>

RunLog::~RunLog() {
    if (m_file.isOpen()) m_file.close();
}

bool RunLog::open(const QString& dir, const QString& tag, const QStringList& command) {
    if (m_file.isOpen()) m_file.close();

    QDir d(dir);
    if (!d.exists() && !d.mkpath(".")) {
        qCWarning(lcSession) << "Cannot create log folder" << dir;
        return false;
    }

    QString fn = d.filePath(QString("%1_%2.log").arg(tag, timestamp()));
    // two runs inside the same second
    for (int n = 2; QFile::exists(fn); ++n)
        fn = d.filePath(QString("%1_%2_%3.log").arg(tag, timestamp()).arg(n));

    m_file.setFileName(fn);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcSession) << "Cannot write log file" << fn << ":" << m_file.errorString();
        return false;
    }
    QTextStream ts(&m_file);
    ts << APP_NAME << " Log - " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
    ts << "Command: " << command.join(' ') << "\n\n";
    ts.flush();
    return true;
}

void RunLog::append(const QStringList& lines) {
    if (!m_file.isOpen()) return;
    QTextStream ts(&m_file);
    for (const QString& l : lines) ts << l << "\n";
    ts.flush();
}

void RunLog::closeWithExit(int exitCode) {
    writeFooter(QString("[exit] %1").arg(exitCode));
}

void RunLog::closeWithFailure(const QString& reason) {
    writeFooter(QString("[failed] %1").arg(reason));
}

void RunLog::writeFooter(const QString& footer) {
    if (!m_file.isOpen()) return;
    QTextStream(&m_file) << "\n" << footer << "\n";
    m_file.close();
}
