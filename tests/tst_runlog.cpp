/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Per-run log files.
 * License: MIT
 * **********************************************************/

#include "AppInfo.h"
#include "RunLog.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTest>

class RunLogTest : public QObject {
    Q_OBJECT
private slots:
    void writesHeaderLinesAndExit();
    void failureFooter();
    void sameSecondGetsDistinctName();
    void appendWhenClosedIsNoop();
};

static QStringList readLines(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    return QString::fromUtf8(f.readAll()).split('\n');
}

void RunLogTest::writesHeaderLinesAndExit() {
    QTemporaryDir dir;
    RunLog log;
    QVERIFY(log.open(dir.path(), "stress", {"/opt/y-cruncher", "stress", "-D:120", "BKT"}));
    QVERIFY(log.isOpen());
    QVERIFY(QFileInfo(log.fileName()).fileName().startsWith("stress_"));
    const QString path = log.fileName();

    log.append({"Iteration 0", "\x1b[32mPassed\x1b[0m"});
    log.closeWithExit(0);
    QVERIFY(!log.isOpen());

    const QStringList lines = readLines(path);
    QVERIFY(lines.value(0).startsWith(QString(APP_NAME) + " Log - "));
    QCOMPARE(lines.value(1), QString("Command: /opt/y-cruncher stress -D:120 BKT"));
    QVERIFY(lines.contains("Iteration 0"));
    QVERIFY(lines.contains("\x1b[32mPassed\x1b[0m"));
    QVERIFY(lines.contains("[exit] 0"));
    QVERIFY(lines.indexOf("Iteration 0") < lines.indexOf("[exit] 0"));
}

void RunLogTest::failureFooter() {
    QTemporaryDir dir;
    RunLog log;
    QVERIFY(log.open(dir.path(), "stress", {"y-cruncher"}));
    const QString path = log.fileName();
    log.closeWithFailure("y-cruncher crashed (signal 11)");
    QVERIFY(readLines(path).contains("[failed] y-cruncher crashed (signal 11)"));
}

void RunLogTest::sameSecondGetsDistinctName() {
    QTemporaryDir dir;
    RunLog a, b;
    QVERIFY(a.open(dir.path(), "stress", {"a"}));
    QVERIFY(b.open(dir.path(), "stress", {"b"}));
    QVERIFY(a.fileName() != b.fileName());
    a.closeWithExit(0);
    b.closeWithExit(0);
    QVERIFY(QDir(dir.path()).entryList({"stress_*.log"}, QDir::Files).size() >= 2);
}

void RunLogTest::appendWhenClosedIsNoop() {
    RunLog log;
    log.append({"ignored"});
    log.closeWithExit(1);
    QVERIFY(!log.isOpen());
}

QTEST_GUILESS_MAIN(RunLogTest)
#include "tst_runlog.moc"
