#include "SourceHighlighter.h"

#include <QPair>

namespace {

enum class LexState { Normal, InString, InLineComment, InBlockComment };

SpanKind kindForState(LexState state) {
    switch (state) {
    case LexState::InString:       return SpanKind::String;
    case LexState::InLineComment:  return SpanKind::LineComment;
    case LexState::InBlockComment: return SpanKind::BlockComment;
    case LexState::Normal:         break;
    }
    return SpanKind::Default;
}

bool isWordChar(QChar c) {
    return c.isLetterOrNumber() || c == QLatin1Char('_');
}

// Pass 1: comments and string literals.
QVector<Span> splitLexicalRegions(const QString &text) {
    QVector<Span> spans;
    const int n = text.size();
    LexState state = LexState::Normal;
    QChar delimiter;
    int start = 0;

    auto flush = [&](int end, SpanKind kind) {
        if (end > start) spans.append(Span{start, end - start, kind});
        start = end;
    };

    for (int i = 0; i < n; ++i) {
        const QChar c    = text.at(i);
        const QChar next = (i + 1 < n) ? text.at(i + 1) : QChar();

        switch (state) {
        case LexState::Normal:
            if (c == '/' && next == '*') {
                flush(i, SpanKind::Default);
                state = LexState::InBlockComment;
                ++i;
            } else if (c == '/' && next == '/') {
                flush(i, SpanKind::Default);
                state = LexState::InLineComment;
                ++i;
            } else if (c == '"' || c == '\'') {
                flush(i, SpanKind::Default);
                state = LexState::InString;
                delimiter = c;
            }
            break;
        case LexState::InString:
            if (c == delimiter) {
                flush(i + 1, SpanKind::String);
                state = LexState::Normal;
            }
            break;
        case LexState::InLineComment:
            if (c == '\n') {
                flush(i + 1, SpanKind::LineComment);
                state = LexState::Normal;
            }
            break;
        case LexState::InBlockComment:
            if (c == '*' && next == '/') {
                flush(i + 2, SpanKind::BlockComment);
                state = LexState::Normal;
                ++i;
            }
            break;
        }
    }

    // Unterminated strings and comments run to the end of the text.
    flush(n, kindForState(state));
    return spans;
}

// Pass 2: maximal word runs over the whole text that are keywords.
QVector<QPair<int, int>> findKeywordRuns(const QString &text) {
    QVector<QPair<int, int>> runs;
    const QSet<QString> &keywords = javaKeywords();
    const int n = text.size();
    int i = 0;
    while (i < n) {
        if (!isWordChar(text.at(i))) { ++i; continue; }
        const int begin = i;
        while (i < n && isWordChar(text.at(i))) ++i;
        if (keywords.contains(text.mid(begin, i - begin)))
            runs.append(qMakePair(begin, i));
    }
    return runs;
}

} // namespace

QVector<Span> highlightSource(const QString &text) {
    const QVector<Span> regions = splitLexicalRegions(text);
    const QVector<QPair<int, int>> runs = findKeywordRuns(text);

    QVector<Span> result;
    result.reserve(regions.size() + runs.size() * 2);
    int r = 0;

    for (const Span &region : regions) {
        if (region.kind != SpanKind::Default) {
            result.append(region);
            continue;
        }

        int cursor = region.start;
        while (r < runs.size() && runs[r].first < region.end()) {
            const int kwBegin = runs[r].first;
            const int kwEnd   = runs[r].second;
            ++r;
            // Matches inside a comment or string, or crossing into one, are dropped.
            if (kwBegin < region.start || kwEnd > region.end()) continue;

            if (kwBegin > cursor)
                result.append(Span{cursor, kwBegin - cursor, SpanKind::Default});
            result.append(Span{kwBegin, kwEnd - kwBegin, SpanKind::Keyword});
            cursor = kwEnd;
        }
        if (cursor < region.end())
            result.append(Span{cursor, region.end() - cursor, SpanKind::Default});
    }
    return result;
}

const QSet<QString> &javaKeywords() {
    static const QSet<QString> keywords = {
        "abstract", "assert", "boolean", "break", "byte", "case", "catch", "char", "class",
        "const", "continue", "default", "do", "double", "else", "enum", "extends", "final",
        "finally", "float", "for", "goto", "if", "implements", "import", "instanceof", "int",
        "interface", "long", "native", "new", "package", "private", "protected", "public",
        "return", "short", "static", "strictfp", "super", "switch", "synchronized", "this",
        "throw", "throws", "transient", "try", "void", "volatile", "while",
        "true", "false", "null", "var"
    };
    return keywords;
}

const char *spanKindName(SpanKind kind) {
    switch (kind) {
    case SpanKind::Default:      return "default";
    case SpanKind::String:       return "string";
    case SpanKind::LineComment:  return "line-comment";
    case SpanKind::BlockComment: return "block-comment";
    case SpanKind::Keyword:      return "keyword";
    }
    return "unknown";
}
