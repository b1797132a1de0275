/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Owns at most one running y-cruncher process
 *              and exposes it as state + an output stream.
 * License: MIT
 * **********************************************************/

#pragma once

#include "TestSelection.h"

#include <QObject>
#include <QStringList>
#include <QThread>

class ProcessWorker;

// Lives on the GUI thread. The child process itself is owned by a
// ProcessWorker on a private thread; all traffic between the two is
// queued signals, so nothing here ever blocks on process I/O.
class SessionManager : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Running, Stopping, Finished, Failed };
    Q_ENUM(State)

    enum class Error { None, AlreadyRunning, EmptySelection, BinaryNotFound, SpawnFailed };
    Q_ENUM(Error)

    static constexpr int DefaultGraceMs = 3000;
    static constexpr int DefaultKillGraceMs = 2000;
    static constexpr int MaxPendingLines = 20000;

    explicit SessionManager(QObject* parent = nullptr);
    ~SessionManager() override;

    void setExecutable(const QString& path) { m_executable = path; }

    // Apply to the next start().
    void setGracePeriod(int ms) { m_graceMs = ms; }
    void setKillGracePeriod(int ms) { m_killGraceMs = ms; }
    int gracePeriod() const { return m_graceMs; }

    Error start(const RunConfig& config);
    Error stop();

    State state() const { return m_state; }
    bool isActive() const { return m_state == State::Running || m_state == State::Stopping; }
    int exitCode() const { return m_exitCode; }
    QString failureReason() const { return m_failureReason; }
    QString lastError() const { return m_lastError; }      // detail of the last start() failure
    QStringList lastCommand() const { return m_lastCommand; }

    // Lines received since the previous call, in emission order. Consumers of
    // outputReady should drain this; only the newest MaxPendingLines are kept.
    QStringList takeOutput();

    static QStringList buildArguments(const RunConfig& config);
    static QString errorString(Error e);
    static QString stateName(State s);

signals:
    void stateChanged(SessionManager::State state);
    void outputReady(const QStringList& lines);
    void finished(int exitCode);
    void failed(const QString& reason);
    void terminationTimedOut();

private:
    void setState(State s);
    void onOutput(const QStringList& lines);
    void onExited(int exitCode, bool crashed);
    void onTerminationTimedOut();
    void onKillTimedOut();
    void fail(const QString& reason);

    QThread        m_thread;
    ProcessWorker* m_worker = nullptr;

    QString     m_executable;
    int         m_graceMs = DefaultGraceMs;
    int         m_killGraceMs = DefaultKillGraceMs;

    State       m_state = State::Idle;
    int         m_exitCode = 0;
    QString     m_failureReason;
    QString     m_lastError;
    QStringList m_lastCommand;
    QStringList m_pending;
};
