/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: One-time download and unpack of the
 *              y-cruncher release (only on user request).
 * License: MIT
 * **********************************************************/

#include "BinaryInstaller.h"
#include "BinaryLocator.h"
#include "Logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSaveFile>

BinaryInstaller::BinaryInstaller(QObject* parent)
    : QObject(parent),
      m_network(new QNetworkAccessManager(this))
{
}

BinaryInstaller::~BinaryInstaller() {
    cancel();
}

// -----------------------------
// download
// -----------------------------

void BinaryInstaller::install(const QUrl& url, const QString& targetDir) {
    if (m_busy) { emit failed("An installation is already in progress"); return; }
    if (!QDir().mkpath(targetDir)) { emit failed("Cannot create " + targetDir); return; }

    m_busy = true;
    m_targetDir = targetDir;
    QString name = QFileInfo(url.path()).fileName();
    if (name.isEmpty()) name = "y-cruncher-download.tar.xz";
    m_archivePath = QDir(targetDir).filePath(name);
    m_removeArchive = true;

    m_archive = std::make_unique<QSaveFile>(m_archivePath);
    if (!m_archive->open(QIODevice::WriteOnly)) {
        fail("Cannot write " + m_archivePath + ": " + m_archive->errorString());
        return;
    }

    qCInfo(lcInstall) << "Downloading" << url.toString() << "to" << m_archivePath;
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    m_reply = m_network->get(req);
    connect(m_reply, &QNetworkReply::readyRead, this, &BinaryInstaller::downloadReadyRead);
    connect(m_reply, &QNetworkReply::downloadProgress, this, &BinaryInstaller::progress);
    connect(m_reply, &QNetworkReply::finished, this, &BinaryInstaller::downloadFinished);
}

void BinaryInstaller::downloadReadyRead() {
    if (!m_reply || !m_archive) return;
    const QByteArray chunk = m_reply->readAll();
    if (m_archive->write(chunk) != chunk.size()) {
        qCWarning(lcInstall) << "Write failed:" << m_archive->errorString();
        m_archive->cancelWriting();
        m_reply->abort();
    }
}

void BinaryInstaller::downloadFinished() {
    if (!m_reply) return;
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    reply->deleteLater();

    if (!m_busy) return;    // cancelled
    if (reply->error() != QNetworkReply::NoError) {
        if (m_archive) m_archive->cancelWriting();
        fail("Download failed: " + reply->errorString());
        return;
    }
    downloadReadyRead();
    if (!m_archive || !m_archive->commit()) {
        fail("Cannot save " + m_archivePath);
        return;
    }
    m_archive.reset();
    if (QFileInfo(m_archivePath).size() == 0) {
        fail("Download is empty");
        return;
    }
    qCInfo(lcInstall) << "Download complete:" << m_archivePath;
    m_busy = false;
    startExtract(m_archivePath, m_targetDir, true);
}

// -----------------------------
// unpack
// -----------------------------

void BinaryInstaller::extract(const QString& archive, const QString& targetDir) {
    if (m_busy) { emit failed("An installation is already in progress"); return; }
    startExtract(archive, targetDir, false);
}

void BinaryInstaller::startExtract(const QString& archive, const QString& targetDir, bool removeArchive) {
    m_busy = true;
    m_archivePath = archive;
    m_targetDir = targetDir;
    m_removeArchive = removeArchive;

    QString tar;
    if (!which("tar", &tar)) { fail("'tar' not found, cannot unpack " + archive); return; }

    m_tar = new QProcess(this);
    m_tar->setProcessChannelMode(QProcess::MergedChannels);
    connect(m_tar, &QProcess::finished, this, &BinaryInstaller::extractFinished);
    connect(m_tar, &QProcess::errorOccurred, this, [this](QProcess::ProcessError e){
        if (e == QProcess::FailedToStart) fail("Cannot run tar: " + m_tar->errorString());
    });
    qCInfo(lcInstall) << "Unpacking" << archive << "into" << targetDir;
    m_tar->start(tar, {"-xf", archive, "-C", targetDir});
}

void BinaryInstaller::extractFinished(int exitCode, QProcess::ExitStatus status) {
    const QString tarOutput = m_tar ? QString::fromLocal8Bit(m_tar->readAll()).trimmed() : QString();
    if (m_tar) { m_tar->deleteLater(); m_tar = nullptr; }
    if (!m_busy) return;

    if (status != QProcess::NormalExit || exitCode != 0) {
        fail(QString("tar exited with code %1: %2").arg(exitCode).arg(tarOutput));
        return;
    }
    auto exe = findExecutable(m_targetDir);
    if (!exe) {
        fail("The archive does not contain a y-cruncher executable");
        return;
    }
    QFile::setPermissions(*exe, QFile::permissions(*exe)
                          | QFileDevice::ExeOwner | QFileDevice::ExeUser
                          | QFileDevice::ExeGroup | QFileDevice::ExeOther);
    finish(*exe);
}

std::optional<QString> BinaryInstaller::findExecutable(const QString& dir) {
    QDirIterator it(dir, {BinaryLocator::ExecutableName}, QDir::Files, QDirIterator::Subdirectories);
    QString best;
    while (it.hasNext()) {
        const QString p = it.next();
        // prefer the shallowest match: the launcher, not a per-ISA copy
        if (best.isEmpty() || p.count('/') < best.count('/')) best = p;
    }
    if (best.isEmpty()) return std::nullopt;
    return best;
}

// -----------------------------
// completion
// -----------------------------

void BinaryInstaller::cancel() {
    const bool wasBusy = m_busy;
    m_busy = false;
    if (m_reply) { m_reply->abort(); }
    if (m_archive) { m_archive->cancelWriting(); m_archive.reset(); }
    if (m_tar && m_tar->state() != QProcess::NotRunning) { m_tar->kill(); m_tar->waitForFinished(1000); }
    if (wasBusy) qCInfo(lcInstall) << "Installation cancelled";
}

void BinaryInstaller::finish(const QString& executable) {
    m_busy = false;
    if (m_removeArchive && !QFile::remove(m_archivePath))
        qCWarning(lcInstall) << "Could not remove" << m_archivePath;
    qCInfo(lcInstall) << "y-cruncher installed at" << executable;
    emit finished(executable);
}

void BinaryInstaller::fail(const QString& reason) {
    m_busy = false;
    if (m_archive) { m_archive->cancelWriting(); m_archive.reset(); }
    if (m_removeArchive) QFile::remove(m_archivePath);
    qCWarning(lcInstall) << reason;
    emit failed(reason);
}
