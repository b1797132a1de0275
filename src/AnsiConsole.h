/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Read-only console pane that renders the SGR
 *              colour codes y-cruncher prints in vterm mode.
 * License: MIT
 * **********************************************************/

#pragma once

#include <QColor>
#include <QTextEdit>
#include <QVector>

struct AnsiSpan {
    QString text;
    QColor  color;  // invalid = console default
};

class AnsiConsole : public QTextEdit {
    Q_OBJECT
public:
    enum class Tag { Plain, Command, Info, Error };

    explicit AnsiConsole(QWidget* parent=nullptr);

    // Split one line at SGR sequences. current carries the colour across
    // lines; other CSI sequences (cursor moves, erase) are dropped.
    static QVector<AnsiSpan> parse(const QString& line, QColor* current);
    static QColor colorForCode(int code);

    void appendAnsi(const QString& line);
    void appendTagged(const QString& text, Tag tag = Tag::Plain);

    void setDark(bool dark);
    bool isDark() const { return m_dark; }

    void clearConsole();

private:
    void insertSpan(const QString& text, const QColor& color);

    QColor m_current;
    QColor m_default;
    bool   m_dark = true;
};
