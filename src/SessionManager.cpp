/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Owns at most one running y-cruncher process
 *              and exposes it as state + an output stream.
 * License: MIT
 * **********************************************************/

#include "SessionManager.h"
#include "BinaryLocator.h"
#include "Logging.h"
#include "ProcessWorker.h"

#include <QMetaObject>

SessionManager::SessionManager(QObject* parent)
    : QObject(parent),
      m_worker(new ProcessWorker)
{
    m_thread.setObjectName("SessionWorker");
    m_worker->moveToThread(&m_thread);
    connect(&m_thread, &QThread::finished, m_worker, &QObject::deleteLater);

    connect(m_worker, &ProcessWorker::output, this, &SessionManager::onOutput);
    connect(m_worker, &ProcessWorker::exited, this, &SessionManager::onExited);
    connect(m_worker, &ProcessWorker::terminationTimedOut, this, &SessionManager::onTerminationTimedOut);
    connect(m_worker, &ProcessWorker::killTimedOut, this, &SessionManager::onKillTimedOut);

    m_thread.start();
}

SessionManager::~SessionManager() {
    disconnect(m_worker, nullptr, this, nullptr);
    if (isActive())
        qCInfo(lcSession) << "Session destroyed while" << stateName(m_state) << "- terminating child";
    QMetaObject::invokeMethod(m_worker, &ProcessWorker::shutdown, Qt::BlockingQueuedConnection);
    m_thread.quit();
    m_thread.wait();
}

// -----------------------------
// command line
// -----------------------------

QStringList SessionManager::buildArguments(const RunConfig& config) {
    QStringList args {"colors:1", "console:linux-vterm", "stress"};
    if (!config.memory.isEmpty()) args << "-M:" + config.memory;
    args << "-D:" + QString::number(config.perTestSeconds);
    args << "-TL:" + QString::number(config.timeLimitSeconds);
    args << config.tests;
    return args;
}

// -----------------------------
// lifecycle
// -----------------------------

SessionManager::Error SessionManager::start(const RunConfig& config) {
    if (isActive()) {
        qCWarning(lcSession) << "start() rejected: a test is already running";
        m_lastError = errorString(Error::AlreadyRunning);
        return Error::AlreadyRunning;
    }
    if (config.tests.isEmpty()) {
        m_lastError = errorString(Error::EmptySelection);
        return Error::EmptySelection;
    }
    if (!BinaryLocator::isUsable(m_executable)) {
        m_lastError = m_executable.isEmpty()
            ? QString("%1 not found").arg(BinaryLocator::ExecutableName)
            : QString("%1 is missing or not executable").arg(m_executable);
        qCWarning(lcSession) << m_lastError;
        return Error::BinaryNotFound;
    }

    const QStringList args = buildArguments(config);
    bool ok = false;
    QString why;
    const QString program = m_executable;
    const int graceMs = m_graceMs, killGraceMs = m_killGraceMs;
    ProcessWorker* worker = m_worker;
    QMetaObject::invokeMethod(m_worker, [&]{
        ok = worker->spawn(program, args, graceMs, killGraceMs, &why);
    }, Qt::BlockingQueuedConnection);

    if (!ok) {
        m_lastError = why;
        return Error::SpawnFailed;
    }

    m_lastCommand = QStringList{m_executable} + args;
    m_lastError.clear();
    m_failureReason.clear();
    m_exitCode = 0;
    m_pending.clear();
    qCInfo(lcSession) << "Run started:" << m_lastCommand.join(' ');
    setState(State::Running);
    return Error::None;
}

SessionManager::Error SessionManager::stop() {
    if (m_state != State::Running) return Error::None;
    setState(State::Stopping);
    QMetaObject::invokeMethod(m_worker, &ProcessWorker::terminate, Qt::QueuedConnection);
    return Error::None;
}

QStringList SessionManager::takeOutput() {
    QStringList out;
    out.swap(m_pending);
    return out;
}

// -----------------------------
// worker events (queued, GUI thread)
// -----------------------------

void SessionManager::onOutput(const QStringList& lines) {
    if (!isActive()) return;
    m_pending.append(lines);
    if (m_pending.size() > MaxPendingLines)
        m_pending = m_pending.mid(m_pending.size() - MaxPendingLines);
    emit outputReady(lines);
}

void SessionManager::onExited(int exitCode, bool crashed) {
    if (!isActive()) {
        qCInfo(lcSession) << "Late exit notification ignored, state" << stateName(m_state);
        return;
    }
    if (crashed && m_state == State::Running) {
        fail(QString("y-cruncher crashed (signal %1)").arg(exitCode));
        return;
    }
    m_exitCode = exitCode;
    setState(State::Finished);
    emit finished(exitCode);
}

void SessionManager::onTerminationTimedOut() {
    if (m_state != State::Stopping) return;
    qCWarning(lcSession) << "Graceful termination timed out, child force-killed";
    emit terminationTimedOut();
}

void SessionManager::onKillTimedOut() {
    if (m_state != State::Stopping) return;
    fail("y-cruncher did not exit after SIGKILL; manual process termination may be required");
}

void SessionManager::fail(const QString& reason) {
    m_failureReason = reason;
    qCWarning(lcSession) << "Run failed:" << reason;
    setState(State::Failed);
    emit failed(reason);
}

void SessionManager::setState(State s) {
    if (s == m_state) return;
    m_state = s;
    emit stateChanged(s);
}

// -----------------------------
// names
// -----------------------------

QString SessionManager::errorString(Error e) {
    switch (e) {
    case Error::None:           return "No error";
    case Error::AlreadyRunning: return "A test is already running";
    case Error::EmptySelection: return "Please select at least one component";
    case Error::BinaryNotFound: return "y-cruncher executable not found";
    case Error::SpawnFailed:    return "Failed to start y-cruncher";
    }
    return "Unknown error";
}

QString SessionManager::stateName(State s) {
    switch (s) {
    case State::Idle:     return "Idle";
    case State::Running:  return "Running";
    case State::Stopping: return "Stopping";
    case State::Finished: return "Finished";
    case State::Failed:   return "Failed";
    }
    return "Unknown";
}
