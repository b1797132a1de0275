/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Gauge value clamping and peak tracking.
 * License: MIT
 * **********************************************************/

#include "DonutGauge.h"

#include <QImage>
#include <QPixmap>
#include <QTest>

class DonutGaugeTest : public QObject {
    Q_OBJECT
private slots:
    void clampsValue();
    void tracksPeak();
    void resetPeakStartsFromCurrent();
    void paintsOffscreen();
};

void DonutGaugeTest::clampsValue() {
    DonutGauge g;
    g.setValue(1.7, "");
    QCOMPARE(g.value(), 1.0);
    g.setValue(-0.2, "");
    QCOMPARE(g.value(), 0.0);
}

void DonutGaugeTest::tracksPeak() {
    DonutGauge g;
    g.setValue(0.4, "");
    g.setValue(0.9, "");
    g.setValue(0.2, "");
    QCOMPARE(g.value(), 0.2);
    QCOMPARE(g.peak(), 0.9);
}

void DonutGaugeTest::resetPeakStartsFromCurrent() {
    DonutGauge g;
    g.setValue(0.9, "");
    g.setValue(0.3, "");
    g.resetPeak();
    QCOMPARE(g.peak(), 0.3);
    g.setValue(0.5, "");
    QCOMPARE(g.peak(), 0.5);
}

void DonutGaugeTest::paintsOffscreen() {
    DonutGauge g;
    g.setLabel("MEMORY");
    g.setAlertThreshold(0.95);
    g.setValue(0.97, "15.5 GiB / 16.0 GiB");
    g.setValue(0.5, "8.0 GiB / 16.0 GiB");
    const QImage img = g.grab().toImage();
    QVERIFY(!img.isNull());
    QCOMPARE(g.size(), g.sizeHint());
}

QTEST_MAIN(DonutGaugeTest)
#include "tst_donutgauge.moc"
