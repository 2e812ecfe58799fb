#pragma once

#include <QSet>
#include <QString>
#include <QVector>

enum class SpanKind {
    Default,
    String,
    LineComment,
    BlockComment,
    Keyword
};

struct Span {
    int      start;
    int      length;
    SpanKind kind;

    int end() const { return start + length; }
    bool operator==(const Span &o) const {
        return start == o.start && length == o.length && kind == o.kind;
    }
};

// Classifies Java-like source into spans that cover the whole text, left to right.
//
// Comments and string literals are found in a single pass; string literals end at
// the first matching quote (escapes are not honoured). Keywords are then picked
// out of the default regions by a word-boundary scan over the full text.
QVector<Span> highlightSource(const QString &text);

const QSet<QString> &javaKeywords();
const char *spanKindName(SpanKind kind);
