/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Background side of the session: owns the
 *              child QProcess, drains its output, enforces
 *              the terminate -> kill escalation.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QStringList>

class QTimer;

// Lives on the session's worker thread. Every method must be called on
// that thread (queued or blocking-queued from the session manager).
class ProcessWorker : public QObject {
    Q_OBJECT
public:
    explicit ProcessWorker(QObject* parent = nullptr);

    // Starts program in a new process group. Fails if the previous child is
    // still alive or the OS refuses to start it.
    bool spawn(const QString& program, const QStringList& args,
               int graceMs, int killGraceMs, QString* error);

    bool isRunning() const;

public slots:
    // SIGTERM to the group; SIGKILL after the grace period.
    void terminate();
    // Synchronous terminate/kill used when the session is torn down.
    void shutdown();

signals:
    void output(const QStringList& lines);
    void exited(int exitCode, bool crashed);
    void terminationTimedOut();
    void killTimedOut();

private:
    void readAvailable();
    void flushPartial();
    void emitLines(const QByteArray& chunk, bool final);
    void processFinished(int exitCode, QProcess::ExitStatus status);
    void graceExpired();
    void killExpired();
    bool signalGroup(int sig);

    QProcess*  m_proc = nullptr;
    QTimer*    m_graceTimer = nullptr;
    QTimer*    m_killTimer = nullptr;
    QByteArray m_partial;
    qint64     m_pgid = 0;
    int        m_graceMs = 3000;
    int        m_killGraceMs = 2000;
    bool       m_stopRequested = false;
};
