/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Background side of the session: owns the
 *              child QProcess, drains its output, enforces
 *              the terminate -> kill escalation.
 * License: MIT
 * **********************************************************/

#include "ProcessWorker.h"
#include "Logging.h"

#include <QTimer>

#include <cerrno>
#include <cstring>
#include <csignal>
#include <sys/types.h>
#include <unistd.h>

ProcessWorker::ProcessWorker(QObject* parent)
    : QObject(parent),
      m_graceTimer(new QTimer(this)),
      m_killTimer(new QTimer(this))
{
    m_graceTimer->setSingleShot(true);
    m_killTimer->setSingleShot(true);
    connect(m_graceTimer, &QTimer::timeout, this, &ProcessWorker::graceExpired);
    connect(m_killTimer, &QTimer::timeout, this, &ProcessWorker::killExpired);
}

bool ProcessWorker::isRunning() const {
    return m_proc && m_proc->state() != QProcess::NotRunning;
}

bool ProcessWorker::spawn(const QString& program, const QStringList& args,
                          int graceMs, int killGraceMs, QString* error) {
    if (isRunning()) {
        if (error) *error = QString("previous process (pid %1) is still alive").arg(m_proc->processId());
        return false;
    }
    if (m_proc) { m_proc->deleteLater(); m_proc = nullptr; }

    m_graceMs = graceMs;
    m_killGraceMs = killGraceMs;
    m_stopRequested = false;
    m_partial.clear();
    m_pgid = 0;

    m_proc = new QProcess(this);
    m_proc->setProgram(program);
    m_proc->setArguments(args);
    m_proc->setProcessChannelMode(QProcess::MergedChannels);    // one pipe keeps the write order
    m_proc->setChildProcessModifier([]{ ::setpgid(0, 0); });     // own group, signalled as a whole

    connect(m_proc, &QProcess::readyReadStandardOutput, this, &ProcessWorker::readAvailable);
    connect(m_proc, &QProcess::finished, this, &ProcessWorker::processFinished);

    m_proc->start();
    if (!m_proc->waitForStarted(5000)) {
        if (error) *error = m_proc->errorString();
        qCWarning(lcSession) << "Failed to start" << program << ":" << m_proc->errorString();
        m_proc->deleteLater();
        m_proc = nullptr;
        return false;
    }

    m_pgid = m_proc->processId();
    qCInfo(lcSession) << "Started" << program << "pid" << m_pgid;
    return true;
}

// --- output ---

void ProcessWorker::readAvailable() {
    if (!m_proc) return;
    const QByteArray data = m_proc->readAllStandardOutput();
    if (!data.isEmpty()) emitLines(data, false);
}

void ProcessWorker::flushPartial() {
    emitLines(QByteArray(), true);
}

void ProcessWorker::emitLines(const QByteArray& chunk, bool final) {
    m_partial.append(chunk);

    QStringList lines;
    int start = 0;
    for (int nl = m_partial.indexOf('\n'); nl >= 0; nl = m_partial.indexOf('\n', start)) {
        QByteArray raw = m_partial.mid(start, nl - start);
        if (raw.endsWith('\r')) raw.chop(1);
        lines << QString::fromLocal8Bit(raw);
        start = nl + 1;
    }
    m_partial.remove(0, start);

    if (final && !m_partial.isEmpty()) {
        if (m_partial.endsWith('\r')) m_partial.chop(1);
        lines << QString::fromLocal8Bit(m_partial);
        m_partial.clear();
    }
    if (!lines.isEmpty()) emit output(lines);
}

// --- exit ---

void ProcessWorker::processFinished(int exitCode, QProcess::ExitStatus status) {
    // anything still buffered in the pipe belongs before the exit notice
    readAvailable();
    flushPartial();

    m_graceTimer->stop();
    m_killTimer->stop();

    // stragglers left in the group after a requested stop
    if (m_stopRequested && m_pgid > 0) ::kill(-pid_t(m_pgid), SIGKILL);

    const bool crashed = status == QProcess::CrashExit;
    qCInfo(lcSession) << "Process" << m_pgid << "exited, code" << exitCode << (crashed ? "(crash)" : "");
    emit exited(exitCode, crashed);
}

// --- termination ---

bool ProcessWorker::signalGroup(int sig) {
    if (!isRunning()) return false;
    if (m_pgid > 0 && ::kill(-pid_t(m_pgid), sig) == 0) return true;
    if (m_pgid > 0 && errno != ESRCH)
        qCWarning(lcSession) << "kill(-" << m_pgid << "," << sig << ") failed:" << std::strerror(errno);

    // group unavailable, signal the child alone
    if (sig == SIGKILL) m_proc->kill();
    else                m_proc->terminate();
    return true;
}

void ProcessWorker::terminate() {
    if (!isRunning() || m_stopRequested) return;
    m_stopRequested = true;
    qCInfo(lcSession) << "Sending SIGTERM to process group" << m_pgid;
    signalGroup(SIGTERM);
    m_graceTimer->start(m_graceMs);
}

void ProcessWorker::graceExpired() {
    if (!isRunning()) return;
    qCWarning(lcSession) << "Process group" << m_pgid << "ignored SIGTERM for" << m_graceMs << "ms, sending SIGKILL";
    signalGroup(SIGKILL);
    emit terminationTimedOut();
    m_killTimer->start(m_killGraceMs);
}

void ProcessWorker::killExpired() {
    if (!isRunning()) return;
    qCCritical(lcSession) << "Process" << m_pgid << "survived SIGKILL for" << m_killGraceMs << "ms";
    emit killTimedOut();
}

void ProcessWorker::shutdown() {
    if (!isRunning()) return;
    m_stopRequested = true;
    signalGroup(SIGTERM);
    if (!m_proc->waitForFinished(m_graceMs)) {
        signalGroup(SIGKILL);
        if (!m_proc->waitForFinished(m_killGraceMs))
            qCCritical(lcSession) << "Process" << m_pgid << "still running at shutdown; it may need to be killed manually";
    }
}
