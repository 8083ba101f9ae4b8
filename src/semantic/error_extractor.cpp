#include "error_extractor.h"
#include <QList>

namespace ErrorExtractor {

qsizetype matchBraces(const QByteArray& text, qsizetype from) {
    int depth = 0;
    for (qsizetype i = from; i < text.size(); ++i) {
        const char c = text.at(i);
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0)
                return i - from + 1;
        }
    }
    return -1;
}

std::optional<QByteArray> extract(const QByteArray& body) {
    const QByteArray trimmed = body.trimmed();
    if (trimmed.startsWith('{') && trimmed.endsWith('}'))
        return body;

    // Last data: line that opens an object wins
    const QList<QByteArray> lines = body.split('\n');
    for (qsizetype i = lines.size() - 1; i >= 0; --i) {
        const QByteArray line = lines.at(i).trimmed();
        if (!line.startsWith("data:"))
            continue;
        const QByteArray payload = line.mid(5).trimmed();
        if (!payload.startsWith('{'))
            continue;
        const qsizetype len = matchBraces(payload);
        if (len > 0)
            return payload.left(len);
        return payload;
    }

    const qsizetype start = body.indexOf('{');
    if (start >= 0) {
        const qsizetype len = matchBraces(body, start);
        if (len > 0)
            return body.mid(start, len);
    }
    return std::nullopt;
}

}
