/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Per-run transcript: command line, console
 *              output and exit status of one stress run.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QFile>
#include <QString>
#include <QStringList>

class RunLog {
public:
    RunLog() = default;
    ~RunLog();

    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    // Creates <dir>/<tag>_<timestamp>.log and writes the header.
    bool open(const QString& dir, const QString& tag, const QStringList& command);
    bool isOpen() const { return m_file.isOpen(); }
    QString fileName() const { return m_file.fileName(); }

    void append(const QStringList& lines);
    void closeWithExit(int exitCode);
    void closeWithFailure(const QString& reason);

private:
    void writeFooter(const QString& footer);

    QFile m_file;
};
