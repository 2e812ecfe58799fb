#include "SourceView.h"
#include <QApplication>
#include <QClipboard>
#include <QPainter>
#include <QScrollBar>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QFontMetrics>
#include <QFont>
#include <algorithm>

static const QString TAB_EXPANSION = QStringLiteral("    ");

static QString displayText(const QString &raw) {
    QString s = raw;
    s.replace('\t', TAB_EXPANSION);
    s.remove('\r');
    return s;
}

static QColor colorFor(SpanKind kind) {
    switch (kind) {
    case SpanKind::Keyword:      return QColor(204, 120, 190);
    case SpanKind::String:       return QColor(120, 170, 255);
    case SpanKind::LineComment:
    case SpanKind::BlockComment: return QColor(110, 160, 120);
    case SpanKind::Default:      break;
    }
    return QColor(220, 220, 220);
}

SourceView::SourceView(QWidget *parent) : QAbstractScrollArea(parent) {
    QFont font("Monospace", 10);
    font.setStyleHint(QFont::TypeWriter);
    setFont(font);
    setFocusPolicy(Qt::StrongFocus);
    updateGeometry();
}

void SourceView::setSource(const QString &text) {
    m_text  = text;
    m_spans = highlightSource(text);

    m_lineStarts.clear();
    m_lineStarts.append(0);
    for (int i = 0; i < m_text.size(); ++i) {
        if (m_text.at(i) == '\n' && i + 1 < m_text.size())
            m_lineStarts.append(i + 1);
    }

    m_cursorLine = 0;
    m_hlStart    = -1;
    m_hlLen      = 0;
    updateGeometry();
    verticalScrollBar()->setValue(0);
    horizontalScrollBar()->setValue(0);
    viewport()->update();
}

void SourceView::clear() {
    setSource(QString());
}

int SourceView::lineOf(int offset) const {
    auto it = std::upper_bound(m_lineStarts.constBegin(), m_lineStarts.constEnd(), offset);
    return qMax(0, int(it - m_lineStarts.constBegin()) - 1);
}

int SourceView::lineEnd(int line) const {
    int end = (line + 1 < m_lineStarts.size()) ? m_lineStarts[line + 1] : m_text.size();
    if (end > m_lineStarts[line] && m_text.at(end - 1) == '\n') --end;
    return end;
}

void SourceView::goToLine(int line) {
    if (line < 1 || line > m_lineStarts.size()) return;
    moveCursorTo(line - 1);
    int visRows = viewport()->height() / m_rowH;
    verticalScrollBar()->setValue(qMax(0, m_cursorLine - visRows / 2));
}

int SourceView::find(const QString &needle) {
    if (needle.isEmpty() || m_text.isEmpty()) return -1;

    int from = (m_cursorLine + 1 < m_lineStarts.size()) ? m_lineStarts[m_cursorLine + 1] : 0;
    int found = m_text.indexOf(needle, from, Qt::CaseInsensitive);
    if (found < 0) found = m_text.indexOf(needle, 0, Qt::CaseInsensitive); // wrap
    if (found < 0) return -1;

    goToLine(lineOf(found) + 1);
    setHighlight(found, needle.size());
    return found;
}

void SourceView::setHighlight(int start, int length) {
    m_hlStart = start;
    m_hlLen   = length;
    viewport()->update();
}

void SourceView::updateGeometry() {
    QFontMetrics fm(font());
    m_charW = fm.horizontalAdvance('M');
    m_charH = fm.height();
    m_rowH  = m_charH + 2;

    // Gutter: enough digits for the last line number + 2 spaces
    int digits = QString::number(qMax(1, m_lineStarts.size())).size();
    m_gutterW = m_charW * (digits + 2);
    m_textX   = m_gutterW + m_charW;

    m_maxLineW = 0;
    for (int line = 0; line < m_lineStarts.size(); ++line) {
        const QString s = displayText(m_text.mid(m_lineStarts[line], lineEnd(line) - m_lineStarts[line]));
        m_maxLineW = qMax(m_maxLineW, fm.horizontalAdvance(s));
    }

    if (!m_text.isEmpty()) {
        int visRows = viewport()->height() / m_rowH;
        verticalScrollBar()->setRange(0, qMax(0, m_lineStarts.size() - visRows));
        verticalScrollBar()->setPageStep(visRows);
        horizontalScrollBar()->setRange(0, qMax(0, m_textX + m_maxLineW - viewport()->width()));
        horizontalScrollBar()->setPageStep(viewport()->width());
    } else {
        verticalScrollBar()->setRange(0, 0);
        horizontalScrollBar()->setRange(0, 0);
    }
}

void SourceView::resizeEvent(QResizeEvent *event) {
    QAbstractScrollArea::resizeEvent(event);
    updateGeometry();
}

void SourceView::paintEvent(QPaintEvent *) {
    QPainter p(viewport());
    p.fillRect(viewport()->rect(), QColor(30, 30, 30));

    if (m_text.isEmpty()) return;

    int firstRow = verticalScrollBar()->value();
    int visRows  = viewport()->height() / m_rowH + 2;

    for (int line = firstRow; line < qMin(firstRow + visRows, m_lineStarts.size()); ++line) {
        int y = (line - firstRow) * m_rowH + m_charH;
        drawLine(p, line, y);
    }

    // Gutter drawn last so scrolled text never shows under it
    p.fillRect(0, 0, m_gutterW, viewport()->height(), QColor(38, 38, 38));
    p.setFont(font());
    for (int line = firstRow; line < qMin(firstRow + visRows, m_lineStarts.size()); ++line) {
        int y = (line - firstRow) * m_rowH + m_charH;
        p.setPen(line == m_cursorLine ? QColor(200, 200, 200) : QColor(100, 150, 200));
        p.drawText(0, y - m_charH + 2, m_gutterW - m_charW, m_rowH,
                   Qt::AlignRight, QString::number(line + 1));
    }
}

void SourceView::drawLine(QPainter &p, int line, int y) {
    const int begin = m_lineStarts[line];
    const int end   = lineEnd(line);
    const int xBase = m_textX - horizontalScrollBar()->value();
    QFontMetrics fm(font());

    if (line == m_cursorLine)
        p.fillRect(m_gutterW, y - m_charH + 2, viewport()->width(), m_rowH, QColor(45, 45, 55));

    // Search highlight
    if (m_hlStart >= 0 && m_hlStart < end && m_hlStart + m_hlLen > begin) {
        int hlBegin = qMax(m_hlStart, begin);
        int hlEnd   = qMin(m_hlStart + m_hlLen, end);
        int x0 = xBase + fm.horizontalAdvance(displayText(m_text.mid(begin, hlBegin - begin)));
        int x1 = xBase + fm.horizontalAdvance(displayText(m_text.mid(begin, hlEnd - begin)));
        p.fillRect(x0, y - m_charH + 2, qMax(x1 - x0, 2), m_rowH, QColor(60, 80, 40));
    }

    // First span that ends after the line start
    auto it = std::upper_bound(m_spans.constBegin(), m_spans.constEnd(), begin,
        [](int offset, const Span &s) { return offset < s.end(); });

    int x = xBase;
    for (; it != m_spans.constEnd() && it->start < end; ++it) {
        int segBegin = qMax(it->start, begin);
        int segEnd   = qMin(it->end(), end);
        if (segEnd <= segBegin) continue;

        QFont f = font();
        if (it->kind == SpanKind::Keyword) f.setBold(true);
        if (it->kind == SpanKind::LineComment || it->kind == SpanKind::BlockComment) f.setItalic(true);
        p.setFont(f);
        p.setPen(colorFor(it->kind));

        const QString seg = displayText(m_text.mid(segBegin, segEnd - segBegin));
        p.drawText(x, y, seg);
        x += QFontMetrics(f).horizontalAdvance(seg);
    }
}

void SourceView::moveCursorTo(int line) {
    int newLine = qBound(0, line, qMax(0, m_lineStarts.size() - 1));
    if (newLine != m_cursorLine) {
        m_cursorLine = newLine;
        emit cursorLineChanged(m_cursorLine + 1);
    }
    viewport()->update();
}

void SourceView::mousePressEvent(QMouseEvent *event) {
    if (m_text.isEmpty()) return;
    int line = verticalScrollBar()->value() + event->pos().y() / m_rowH;
    if (line >= m_lineStarts.size()) return;
    moveCursorTo(line);
}

void SourceView::keyPressEvent(QKeyEvent *event) {
    if (m_text.isEmpty()) return;

    if (event->matches(QKeySequence::Copy) || event->matches(QKeySequence::SelectAll)) {
        QApplication::clipboard()->setText(m_text);
        return;
    }

    auto move = [&](int delta) {
        moveCursorTo(m_cursorLine + delta);
        // Scroll into view
        int firstRow = verticalScrollBar()->value();
        int visRows  = viewport()->height() / m_rowH;
        if (m_cursorLine < firstRow) verticalScrollBar()->setValue(m_cursorLine);
        if (m_cursorLine >= firstRow + visRows) verticalScrollBar()->setValue(m_cursorLine - visRows + 1);
    };

    int page = qMax(1, viewport()->height() / m_rowH);
    switch (event->key()) {
    case Qt::Key_Down:     move(1);     break;
    case Qt::Key_Up:       move(-1);    break;
    case Qt::Key_PageDown: move(page);  break;
    case Qt::Key_PageUp:   move(-page); break;
    case Qt::Key_Home:     move(-m_cursorLine); break;
    case Qt::Key_End:      move(m_lineStarts.size()); break;
    case Qt::Key_Right:
        horizontalScrollBar()->setValue(horizontalScrollBar()->value() + m_charW * 4);
        break;
    case Qt::Key_Left:
        horizontalScrollBar()->setValue(horizontalScrollBar()->value() - m_charW * 4);
        break;
    default:
        QAbstractScrollArea::keyPressEvent(event);
        break;
    }
}
