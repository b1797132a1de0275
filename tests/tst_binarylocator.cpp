/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Lookup of the y-cruncher executable.
 * License: MIT
 * **********************************************************/

#include "BinaryLocator.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTest>

class BinaryLocatorTest : public QObject {
    Q_OBJECT
private slots:
    void usableNeedsExecBit();
    void preferredWins();
    void directFile();
    void nestedReleaseFolder();
    void unusablePreferredFallsBack();
    void whichFindsShell();
};

static QString makeFile(const QString& path, bool executable) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return QString();
    f.write("#!/bin/sh\nexit 0\n");
    f.close();
    QFile::Permissions p = QFileDevice::ReadOwner | QFileDevice::WriteOwner;
    if (executable) p |= QFileDevice::ExeOwner;
    f.setPermissions(p);
    return QFileInfo(path).absoluteFilePath();
}

void BinaryLocatorTest::usableNeedsExecBit() {
    QTemporaryDir dir;
    const QString exe = makeFile(dir.filePath("run"), true);
    const QString plain = makeFile(dir.filePath("data"), false);
    QVERIFY(BinaryLocator::isUsable(exe));
    QVERIFY(!BinaryLocator::isUsable(plain));
    QVERIFY(!BinaryLocator::isUsable(dir.path()));
    QVERIFY(!BinaryLocator::isUsable(QString()));
    QVERIFY(!BinaryLocator::isUsable(dir.filePath("missing")));
}

void BinaryLocatorTest::preferredWins() {
    QTemporaryDir dir;
    makeFile(dir.filePath("y-cruncher"), true);
    const QString custom = makeFile(dir.filePath("custom/yc"), true);
    BinaryLocator loc({dir.path()});
    QCOMPARE(loc.locate(custom).value_or(QString()), custom);
}

void BinaryLocatorTest::directFile() {
    QTemporaryDir dir;
    const QString exe = makeFile(dir.filePath("y-cruncher"), true);
    BinaryLocator loc({dir.path()});
    QCOMPARE(loc.locate().value_or(QString()), exe);
}

void BinaryLocatorTest::nestedReleaseFolder() {
    QTemporaryDir dir;
    const QString exe = makeFile(dir.filePath("y-cruncher v0.8.6.9545-static/y-cruncher"), true);
    BinaryLocator loc({dir.path()});
    QCOMPARE(loc.locate().value_or(QString()), exe);
}

void BinaryLocatorTest::unusablePreferredFallsBack() {
    QTemporaryDir dir;
    const QString exe = makeFile(dir.filePath("y-cruncher"), true);
    BinaryLocator loc({dir.path()});
    QCOMPARE(loc.locate(dir.filePath("gone/y-cruncher")).value_or(QString()), exe);
}

void BinaryLocatorTest::whichFindsShell() {
    QString sh;
    QVERIFY(which("sh", &sh));
    QVERIFY(BinaryLocator::isUsable(sh));
    QVERIFY(!which("definitely-not-a-real-program-ycgui"));
}

QTEST_GUILESS_MAIN(BinaryLocatorTest)
#include "tst_binarylocator.moc"
