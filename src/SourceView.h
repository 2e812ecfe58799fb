#pragma once

#include <QAbstractScrollArea>
#include <QString>
#include <QVector>
#include "SourceHighlighter.h"

// Read-only source viewer.
// Paints line numbers and the highlighter's spans; supports go-to-line and
// find with a highlighted match. Ctrl+C copies the whole source.

class SourceView : public QAbstractScrollArea {
    Q_OBJECT
public:
    explicit SourceView(QWidget *parent = nullptr);

    void setSource(const QString &text);
    void clear();
    const QString &text() const { return m_text; }
    int lineCount() const { return m_lineStarts.size(); }
    int cursorLine() const { return m_cursorLine + 1; }

    // 1-based
    void goToLine(int line);

    // Case-insensitive search after the cursor line, wrapping to the top.
    // Returns the match offset or -1.
    int find(const QString &needle);

    // Highlight a range (e.g., a search match)
    void setHighlight(int start, int length);

signals:
    void cursorLineChanged(int line);

protected:
    void paintEvent(QPaintEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;

private:
    void updateGeometry();
    void moveCursorTo(int line);
    int lineOf(int offset) const;
    int lineEnd(int line) const;
    void drawLine(QPainter &p, int line, int y);

    QString      m_text;
    QVector<Span> m_spans;
    QVector<int> m_lineStarts;
    int          m_cursorLine = 0;
    int          m_hlStart    = -1;
    int          m_hlLen      = 0;

    // Layout (computed in updateGeometry)
    int m_charW     = 10;
    int m_charH     = 16;
    int m_rowH      = 0;
    int m_gutterW   = 0;
    int m_textX     = 0;
    int m_maxLineW  = 0;
};
