/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Selection, time limit and memory rules.
 * License: MIT
 * **********************************************************/

#include "ConfigStore.h"
#include "TestSelection.h"

#include <QTest>

class TestSelectionTest : public QObject {
    Q_OBJECT
private slots:
    void startsEmpty();
    void autoTimeLimitFollowsCount();
    void manualTimeLimitSurvivesChanges();
    void manualTimeLimitRaisedToMinimum();
    void deselectAllResetsTimeLimit();
    void presetSelectAllDeselectAll();
    void rejectsNonPositiveDurations();
    void rejectsOversizedDurations();
    void unknownIdIgnored();
    void presetReplacesSelection();
    void selectedIdsInCatalogOrder();
    void memoryValidation_data();
    void memoryValidation();
    void setMemoryNormalizes();
    void runConfigCarriesFields();
    void persistedRoundTrip();
    void persistedDropsUnknownIds();
};

void TestSelectionTest::startsEmpty() {
    TestCatalog c; TestSelection s(c);
    QCOMPARE(s.count(), 0);
    QVERIFY(!s.isTimeLimitManual());
    QCOMPARE(s.timeLimitSeconds(), 0);
    QCOMPARE(s.perTestSeconds(), TestSelection::DefaultPerTestDuration);
    QVERIFY(s.memory().isEmpty());
}

void TestSelectionTest::autoTimeLimitFollowsCount() {
    TestCatalog c;
    // every subset of the eight components
    for (int mask = 0; mask < (1 << c.tests().size()); ++mask) {
        TestSelection s(c);
        int n = 0;
        for (int i = 0; i < c.tests().size(); ++i) {
            if (mask & (1 << i)) { s.setSelected(c.tests()[i].id, true); ++n; }
        }
        QCOMPARE(s.count(), n);
        QCOMPARE(s.timeLimitSeconds(), 1800 * n);
    }
}

void TestSelectionTest::manualTimeLimitSurvivesChanges() {
    TestCatalog c; TestSelection s(c);
    s.setSelected("BKT", true);
    QVERIFY(s.setTimeLimit(5000));
    s.setSelected("BBP", true);
    QCOMPARE(s.timeLimitSeconds(), 5000);
    s.selectAll();
    QCOMPARE(s.timeLimitSeconds(), 5000);
    s.applyPreset(PresetKind::Ram);
    QCOMPARE(s.timeLimitSeconds(), 5000);
    QVERIFY(s.isTimeLimitManual());

    QVERIFY(s.setTimeLimit(std::nullopt));
    QCOMPARE(s.timeLimitSeconds(), 1800);
}

void TestSelectionTest::manualTimeLimitRaisedToMinimum() {
    TestCatalog c; TestSelection s(c);
    s.selectAll();
    QVERIFY(s.setPerTestDuration(60));
    QVERIFY(s.setTimeLimit(100));
    QCOMPARE(s.minimumTimeLimit(), 480);
    QVERIFY(s.timeLimitCorrected());
    QCOMPARE(s.timeLimitSeconds(), 480);
    QCOMPARE(*s.manualTimeLimit(), 100);

    s.applyPreset(PresetKind::Ram);   // one test: 100 >= 60
    QVERIFY(!s.timeLimitCorrected());
    QCOMPARE(s.timeLimitSeconds(), 100);
}

void TestSelectionTest::deselectAllResetsTimeLimit() {
    TestCatalog c; TestSelection s(c);
    s.selectAll();
    s.setTimeLimit(999999);
    s.deselectAll();
    QCOMPARE(s.count(), 0);
    QVERIFY(!s.isTimeLimitManual());
    QCOMPARE(s.timeLimitSeconds(), 0);
}

void TestSelectionTest::presetSelectAllDeselectAll() {
    TestCatalog c; TestSelection s(c);
    s.applyPreset(PresetKind::Cpu);
    QCOMPARE(s.count(), 5);
    s.selectAll();
    QCOMPARE(s.count(), 8);
    QCOMPARE(s.timeLimitSeconds(), 8 * 1800);
    s.deselectAll();
    QVERIFY(s.selectedIds().isEmpty());
    QVERIFY(!s.isTimeLimitManual());
    QCOMPARE(s.timeLimitSeconds(), 0);
}

void TestSelectionTest::rejectsNonPositiveDurations() {
    TestCatalog c; TestSelection s(c);
    QVERIFY(s.setTimeLimit(300));
    QVERIFY(!s.setTimeLimit(0));
    QVERIFY(!s.setTimeLimit(-5));
    QCOMPARE(*s.manualTimeLimit(), 300);

    QVERIFY(!s.setPerTestDuration(0));
    QCOMPARE(s.perTestSeconds(), TestSelection::DefaultPerTestDuration);
}

void TestSelectionTest::rejectsOversizedDurations() {
    TestCatalog c; TestSelection s(c);
    QVERIFY(s.setTimeLimit(60));
    QVERIFY(!s.setPerTestDuration(268435456));
    QVERIFY(!s.setTimeLimit(TestSelection::MaxTimeLimit + 1));
    QCOMPARE(s.perTestSeconds(), TestSelection::DefaultPerTestDuration);
    QCOMPARE(*s.manualTimeLimit(), 60);

    // the largest accepted values keep -TL >= -D x count
    QVERIFY(s.setPerTestDuration(TestSelection::MaxPerTestDuration));
    s.selectAll();
    QCOMPARE(s.minimumTimeLimit(), TestSelection::MaxPerTestDuration * s.count());
    QVERIFY(s.timeLimitCorrected());
    QCOMPARE(s.timeLimitSeconds(), s.minimumTimeLimit());
    const RunConfig rc = s.runConfig();
    QVERIFY(rc.timeLimitSeconds >= rc.perTestSeconds * rc.tests.size());
}

void TestSelectionTest::unknownIdIgnored() {
    TestCatalog c; TestSelection s(c);
    QVERIFY(!s.setSelected("NOPE", true));
    QCOMPARE(s.count(), 0);
}

void TestSelectionTest::presetReplacesSelection() {
    TestCatalog c; TestSelection s(c);
    s.setSelected("FFTv4", true);
    s.applyPreset(PresetKind::Cpu);
    QVERIFY(!s.isSelected("FFTv4"));
    QCOMPARE(s.selectedIds(), QStringList({"BKT","BBP","SFTv4","SNT","SVT"}));
}

void TestSelectionTest::selectedIdsInCatalogOrder() {
    TestCatalog c; TestSelection s(c);
    s.setSelected("VT3", true);
    s.setSelected("BKT", true);
    s.setSelected("FFTv4", true);
    QCOMPARE(s.selectedIds(), QStringList({"BKT","FFTv4","VT3"}));
    s.setSelected("FFTv4", false);
    QCOMPARE(s.selectedIds(), QStringList({"BKT","VT3"}));
}

void TestSelectionTest::memoryValidation_data() {
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::newRow("empty")    << ""      << true;
    QTest::newRow("auto")     << "Auto"  << true;
    QTest::newRow("plain")    << "1024"  << true;
    QTest::newRow("mega")     << "512M"  << true;
    QTest::newRow("giga")     << "8G"    << true;
    QTest::newRow("lower")    << "16g"   << true;
    QTest::newRow("decimal")  << "1.5T"  << true;
    QTest::newRow("unit")     << "8GB"   << false;
    QTest::newRow("word")     << "lots"  << false;
    QTest::newRow("negative") << "-1G"   << false;
    QTest::newRow("dot")      << "1.G"   << false;
}

void TestSelectionTest::memoryValidation() {
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QCOMPARE(TestSelection::isValidMemory(text), valid);
}

void TestSelectionTest::setMemoryNormalizes() {
    TestCatalog c; TestSelection s(c);
    QVERIFY(s.setMemory(" 16g "));
    QCOMPARE(s.memory(), QString("16G"));
    QVERIFY(!s.setMemory("8GB"));
    QCOMPARE(s.memory(), QString("16G"));
    QVERIFY(s.setMemory("auto"));
    QVERIFY(s.memory().isEmpty());
}

void TestSelectionTest::runConfigCarriesFields() {
    TestCatalog c; TestSelection s(c);
    s.applyPreset(PresetKind::CpuRam);
    s.setPerTestDuration(90);
    s.setMemory("4G");
    const RunConfig rc = s.runConfig();
    QCOMPARE(rc.tests, QStringList({"N63","VT3"}));
    QCOMPARE(rc.timeLimitSeconds, 3600);
    QCOMPARE(rc.perTestSeconds, 90);
    QCOMPARE(rc.memory, QString("4G"));
}

void TestSelectionTest::persistedRoundTrip() {
    TestCatalog c; TestSelection s(c);
    s.setSelected("SNT", true);
    s.setSelected("N63", true);
    s.setTimeLimit(7200);
    s.setMemory("2G");

    const PersistedConfig cfg = s.toPersisted();
    QCOMPARE(cfg.tests.size(), 8);
    QCOMPARE(cfg.tests.value("SNT"), true);
    QCOMPARE(cfg.tests.value("BKT"), false);

    TestSelection r(c);
    r.applyPersisted(cfg);
    QCOMPARE(r.selectedIds(), s.selectedIds());
    QVERIFY(r.manualTimeLimit() == s.manualTimeLimit());
    QVERIFY(r.manualPerTestDuration() == s.manualPerTestDuration());
    QCOMPARE(r.memory(), s.memory());
}

void TestSelectionTest::persistedDropsUnknownIds() {
    TestCatalog c; TestSelection s(c);
    PersistedConfig cfg;
    cfg.tests.insert("BKT", true);
    cfg.tests.insert("OLD", true);
    cfg.timeLimit = -3;
    cfg.memory = "garbage";
    s.applyPersisted(cfg);
    QCOMPARE(s.selectedIds(), QStringList({"BKT"}));
    QVERIFY(!s.isTimeLimitManual());
    QVERIFY(s.memory().isEmpty());
}

QTEST_GUILESS_MAIN(TestSelectionTest)
#include "tst_testselection.moc"
