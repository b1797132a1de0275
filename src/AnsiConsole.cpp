/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Read-only console pane that renders the SGR
 *              colour codes y-cruncher prints in vterm mode.
 * License: MIT
 * **********************************************************/

#include "AnsiConsole.h"

#include <QFontDatabase>
#include <QRegularExpression>
#include <QScrollBar>
#include <QTextCharFormat>
#include <QTextCursor>

AnsiConsole::AnsiConsole(QWidget* parent)
    : QTextEdit(parent)
{
    setReadOnly(true);
    setLineWrapMode(QTextEdit::WidgetWidth);
    setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    document()->setMaximumBlockCount(20000);   // keep the tail of multi-hour runs
    setDark(true);
}

QColor AnsiConsole::colorForCode(int code) {
    switch (code) {
    case 30: return QColor("#000000");
    case 31: return QColor("#CD3131");
    case 32: return QColor("#0DBC79");
    case 33: return QColor("#E5E510");
    case 34: return QColor("#2472C8");
    case 35: return QColor("#BC3FBC");
    case 36: return QColor("#11A8CD");
    case 37: return QColor("#E5E5E5");
    case 90: return QColor("#666666");
    case 91: return QColor("#F14C4C");
    case 92: return QColor("#23D18B");
    case 93: return QColor("#F5F543");
    case 94: return QColor("#3B8EEA");
    case 95: return QColor("#D670D6");
    case 96: return QColor("#29B8DB");
    case 97: return QColor("#FFFFFF");
    default: return QColor();
    }
}

QVector<AnsiSpan> AnsiConsole::parse(const QString& line, QColor* current) {
    static const QRegularExpression csi("\\x1b\\[([0-9;?]*)([A-Za-z])");

    QVector<AnsiSpan> spans;
    QColor color = current ? *current : QColor();
    auto push = [&](const QString& text) {
        if (text.isEmpty()) return;
        if (!spans.isEmpty() && spans.last().color == color) spans.last().text += text;
        else spans.push_back({text, color});
    };

    int pos = 0;
    auto it = csi.globalMatch(line);
    while (it.hasNext()) {
        const auto m = it.next();
        push(line.mid(pos, m.capturedStart() - pos));
        pos = m.capturedEnd();
        if (m.captured(2) != "m") continue;

        const QStringList codes = m.captured(1).split(';');
        for (const QString& c : codes) {
            bool ok = false;
            const int code = c.isEmpty() ? 0 : c.toInt(&ok);
            if (c.isEmpty() || (ok && (code == 0 || code == 39))) color = QColor();
            else if (ok && colorForCode(code).isValid()) color = colorForCode(code);
        }
    }
    push(line.mid(pos));

    if (current) *current = color;
    return spans;
}

void AnsiConsole::insertSpan(const QString& text, const QColor& color) {
    QTextCursor c(document());
    c.movePosition(QTextCursor::End);
    QTextCharFormat fmt;
    fmt.setForeground(color.isValid() ? color : m_default);
    c.insertText(text, fmt);
}

void AnsiConsole::appendAnsi(const QString& line) {
    QScrollBar* sb = verticalScrollBar();
    const bool atBottom = sb->value() == sb->maximum();

    if (!document()->isEmpty()) insertSpan("\n", QColor());
    for (const auto& span : parse(line, &m_current)) insertSpan(span.text, span.color);

    if (atBottom) sb->setValue(sb->maximum());
}

void AnsiConsole::appendTagged(const QString& text, Tag tag) {
    QColor color;
    switch (tag) {
    case Tag::Plain:   break;
    case Tag::Command: color = QColor("#569cd6"); break;
    case Tag::Info:    color = QColor("#6a9955"); break;
    case Tag::Error:   color = QColor("#f44747"); break;
    }
    const QStringList lines = text.split('\n');
    for (const QString& l : lines) {
        if (!document()->isEmpty()) insertSpan("\n", QColor());
        insertSpan(l, color);
    }
    verticalScrollBar()->setValue(verticalScrollBar()->maximum());
}

void AnsiConsole::setDark(bool dark) {
    m_dark = dark;
    m_default = dark ? QColor("#d4d4d4") : QColor("#111827");
    setStyleSheet(QString("QTextEdit{background:%1; color:%2;}")
                      .arg(dark ? "#1e1e1e" : "#ffffff", m_default.name()));
}

void AnsiConsole::clearConsole() {
    clear();
    m_current = QColor();
}
