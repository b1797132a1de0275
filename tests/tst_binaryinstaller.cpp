/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Download and unpack of the y-cruncher archive,
 *              served from file:// URLs.
 * License: MIT
 * **********************************************************/

#include "BinaryInstaller.h"
#include "BinaryLocator.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

class BinaryInstallerTest : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void findExecutablePrefersShallowest();
    void findExecutableMissing();
    void extractArchive();
    void extractGarbageFails();
    void installFromUrl();
    void installMissingUrlFails();

private:
    QString makeArchive(const QString& name);

    QTemporaryDir m_dir;
    bool m_haveTar = false;
};

static void touch(const QString& path, bool executable) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return;
    f.write("#!/bin/sh\nexit 0\n");
    f.close();
    QFile::Permissions p = QFileDevice::ReadOwner | QFileDevice::WriteOwner;
    if (executable) p |= QFileDevice::ExeOwner;
    f.setPermissions(p);
}

void BinaryInstallerTest::initTestCase() {
    QVERIFY(m_dir.isValid());
    m_haveTar = which("tar");
}

// Release layout: launcher at the top of the versioned folder, per-ISA copies below.
QString BinaryInstallerTest::makeArchive(const QString& name) {
    const QString src = m_dir.filePath(name + "-src");
    touch(src + "/y-cruncher v0.8.6.9545-static/y-cruncher", false);
    touch(src + "/y-cruncher v0.8.6.9545-static/Binaries/y-cruncher", true);

    const QString archive = m_dir.filePath(name + ".tar");
    QProcess tar;
    tar.start("tar", {"-cf", archive, "-C", src, "."});
    if (!tar.waitForFinished(10000) || tar.exitCode() != 0) return QString();
    return archive;
}

void BinaryInstallerTest::findExecutablePrefersShallowest() {
    QTemporaryDir dir;
    touch(dir.filePath("release/deep/er/y-cruncher"), true);
    touch(dir.filePath("release/y-cruncher"), true);
    QCOMPARE(BinaryInstaller::findExecutable(dir.path()).value_or(QString()),
             dir.filePath("release/y-cruncher"));
}

void BinaryInstallerTest::findExecutableMissing() {
    QTemporaryDir dir;
    touch(dir.filePath("release/readme.txt"), false);
    QVERIFY(!BinaryInstaller::findExecutable(dir.path()).has_value());
}

void BinaryInstallerTest::extractArchive() {
    if (!m_haveTar) QSKIP("tar not available");
    const QString archive = makeArchive("extract");
    QVERIFY(!archive.isEmpty());
    const QString target = m_dir.filePath("extract-target");
    QVERIFY(QDir().mkpath(target));

    BinaryInstaller inst;
    QSignalSpy done(&inst, &BinaryInstaller::finished);
    QSignalSpy failed(&inst, &BinaryInstaller::failed);
    inst.extract(archive, target);
    QVERIFY(inst.isBusy());
    QTRY_COMPARE_WITH_TIMEOUT(done.count() + failed.count(), 1, 10000);
    QCOMPARE(failed.count(), 0);

    const QString exe = done.at(0).at(0).toString();
    QCOMPARE(QFileInfo(exe).fileName(), QString("y-cruncher"));
    QCOMPARE(QFileInfo(exe).absolutePath(), QDir(target).filePath("y-cruncher v0.8.6.9545-static"));
    QVERIFY(BinaryLocator::isUsable(exe));     // exec bit added after unpacking
    QVERIFY(QFile::exists(archive));           // local archives are left alone
    QVERIFY(!inst.isBusy());
}

void BinaryInstallerTest::extractGarbageFails() {
    if (!m_haveTar) QSKIP("tar not available");
    const QString bogus = m_dir.filePath("bogus.tar");
    QFile f(bogus);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("this is not a tar archive");
    f.close();
    const QString target = m_dir.filePath("bogus-target");
    QVERIFY(QDir().mkpath(target));

    BinaryInstaller inst;
    QSignalSpy failed(&inst, &BinaryInstaller::failed);
    inst.extract(bogus, target);
    QTRY_COMPARE_WITH_TIMEOUT(failed.count(), 1, 10000);
    QVERIFY(failed.at(0).at(0).toString().startsWith("tar exited"));
    QVERIFY(!inst.isBusy());
}

void BinaryInstallerTest::installFromUrl() {
    if (!m_haveTar) QSKIP("tar not available");
    const QString archive = makeArchive("download");
    QVERIFY(!archive.isEmpty());
    const QString target = m_dir.filePath("install-target");

    BinaryInstaller inst;
    QSignalSpy done(&inst, &BinaryInstaller::finished);
    QSignalSpy failed(&inst, &BinaryInstaller::failed);
    inst.install(QUrl::fromLocalFile(archive), target);
    QVERIFY(inst.isBusy());

    QSignalSpy again(&inst, &BinaryInstaller::failed);
    inst.install(QUrl::fromLocalFile(archive), target);   // rejected while busy
    QCOMPARE(again.count(), 1);
    QCOMPARE(failed.count(), 1);

    QTRY_COMPARE_WITH_TIMEOUT(done.count(), 1, 10000);
    QCOMPARE(failed.count(), 1);
    QVERIFY(BinaryLocator::isUsable(done.at(0).at(0).toString()));
    QVERIFY(!QFile::exists(QDir(target).filePath("download.tar")));   // downloaded copy removed
    QVERIFY(QFile::exists(archive));
}

void BinaryInstallerTest::installMissingUrlFails() {
    const QString target = m_dir.filePath("missing-target");
    BinaryInstaller inst;
    QSignalSpy failed(&inst, &BinaryInstaller::failed);
    inst.install(QUrl::fromLocalFile(m_dir.filePath("nothing-here.tar.xz")), target);
    QTRY_COMPARE_WITH_TIMEOUT(failed.count(), 1, 10000);
    QVERIFY(failed.at(0).at(0).toString().startsWith("Download failed"));
    QVERIFY(!QFile::exists(QDir(target).filePath("nothing-here.tar.xz")));
    QVERIFY(!inst.isBusy());
}

QTEST_GUILESS_MAIN(BinaryInstallerTest)
#include "tst_binaryinstaller.moc"
