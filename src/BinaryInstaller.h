/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: One-time download and unpack of the
 *              y-cruncher release (only on user request).
 * License: MIT
 * **********************************************************/

#pragma once

#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QUrl>
#include <memory>
#include <optional>

class QNetworkAccessManager;
class QNetworkReply;
class QSaveFile;

class BinaryInstaller : public QObject {
    Q_OBJECT
public:
    static constexpr const char* DefaultUrl =
        "https://cdn.numberworld.org/y-cruncher-downloads/y-cruncher%20v0.8.6.9545-static.tar.xz";

    explicit BinaryInstaller(QObject* parent = nullptr);
    ~BinaryInstaller() override;

    // Download url into targetDir, unpack it there and locate the executable.
    void install(const QUrl& url, const QString& targetDir);
    // Unpack an archive that is already on disk.
    void extract(const QString& archive, const QString& targetDir);
    void cancel();
    bool isBusy() const { return m_busy; }

    static std::optional<QString> findExecutable(const QString& dir);

signals:
    void progress(qint64 received, qint64 total);
    void finished(const QString& executable);
    void failed(const QString& reason);

private:
    void downloadReadyRead();
    void downloadFinished();
    void startExtract(const QString& archive, const QString& targetDir, bool removeArchive);
    void extractFinished(int exitCode, QProcess::ExitStatus status);
    void finish(const QString& executable);
    void fail(const QString& reason);

    QNetworkAccessManager*     m_network = nullptr;
    QPointer<QNetworkReply>    m_reply;
    std::unique_ptr<QSaveFile> m_archive;
    QPointer<QProcess>         m_tar;
    QString m_archivePath;
    QString m_targetDir;
    bool    m_removeArchive = false;
    bool    m_busy = false;
};
