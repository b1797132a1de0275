/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Compact semicircle gauge used for the CPU
 *              and memory load readouts.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QColor>
#include <QWidget>

class DonutGauge : public QWidget {
    Q_OBJECT
public:
    explicit DonutGauge(QWidget* parent=nullptr);

    QSize sizeHint() const override { return {180,150}; }

    void setLabel(const QString& t) { m_label = t; update(); }
    void setArcColor(const QColor& c) { m_arc = c; update(); }
    void setTrackColor(const QColor& c) { m_track = c; update(); }
    void setTextColor(const QColor& c) { m_text = c; update(); }
    // Above this fraction the arc is drawn in the alert colour.
    void setAlertThreshold(double v) { m_alertAt = v; update(); }

    double value() const { return m_value; }
    double peak() const { return m_peak; }
    void setValue(double v, const QString& cap);
    // Peak marker restarts from the current value (called when a run starts).
    void resetPeak() { m_peak = m_value; update(); }

protected:
    void paintEvent(QPaintEvent*) override;

private:
    static constexpr int Sweep = 280;   // degrees

    QRectF arcRect() const;

    QString m_label, m_captionText;
    QColor  m_arc   = QColor("#84cc16");
    QColor  m_alert = QColor("#e11d48");
    QColor  m_track = QColor("#c7ced6");
    QColor  m_text  = Qt::black;
    double  m_alertAt = 1.1;
    double  m_value = 0.0;
    double  m_peak = 0.0;
};
