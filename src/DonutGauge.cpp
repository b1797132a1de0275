/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Compact semicircle gauge used for the CPU
 *              and memory load readouts.
 * License: MIT
 * **********************************************************/

#include "DonutGauge.h"

#include <QPainter>
#include <algorithm>
#include <cmath>

DonutGauge::DonutGauge(QWidget* parent)
    : QWidget(parent)
{
    setSizePolicy(QSizePolicy::Fixed, QSizePolicy::Fixed);
    setFixedSize(sizeHint());
}

void DonutGauge::setValue(double v, const QString& cap) {
    m_value = std::clamp(v, 0.0, 1.0);
    m_peak = std::max(m_peak, m_value);
    m_captionText = cap;
    update();
}

QRectF DonutGauge::arcRect() const {
    const int pad = 10, labelBand = 20;
    return QRectF(pad, pad + labelBand, width() - 2*pad,
                  std::min(height()*2 - 2*pad, width() - 2*pad));
}

void DonutGauge::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);

    const QRectF r = arcRect();
    const int arcw = 12;
    // Qt angles are 1/16 degree, counter-clockwise from 3 o'clock
    const int start = 16*Sweep;

    p.setPen(m_text);
    QFont f = font(); f.setBold(true); f.setPointSize(10);
    p.setFont(f);
    p.drawText(QRect(0, 10, width(), 16), Qt::AlignHCenter|Qt::AlignVCenter, m_label);

    QPen pen(m_track, arcw);
    pen.setCapStyle(Qt::RoundCap);
    p.setPen(pen);
    p.drawArc(r, start, 16*Sweep);

    pen.setColor(m_value >= m_alertAt ? m_alert : m_arc);
    p.setPen(pen);
    p.drawArc(r, start, int(16*Sweep*m_value));

    // peak since the run started
    if (m_peak > m_value + 0.01) {
        QPen tick(m_peak >= m_alertAt ? m_alert : m_text, arcw + 4);
        tick.setCapStyle(Qt::FlatCap);
        p.setPen(tick);
        p.drawArc(r, start + int(16*Sweep*m_peak) - 16, 32);
    }

    QFont fv = font(); fv.setBold(true); fv.setPointSize(12);
    p.setFont(fv);
    p.setPen(m_text);
    const QPoint c(width()/2, int(r.top() + r.height()*0.55));
    p.drawText(QRect(c.x()-60, c.y()-12, 120, 24), Qt::AlignCenter,
               QString::number(int(std::round(m_value*100))) + "%");

    p.setFont(font());
    p.drawText(QRect(0, height()-18, width(), 16), Qt::AlignHCenter|Qt::AlignVCenter, m_captionText);
}
