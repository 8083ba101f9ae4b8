#pragma once
#include <QByteArray>
#include <optional>

// Locates the JSON object worth reporting inside an error body that may be
// plain JSON, an event-stream transcript or free text.
//
// Brace matching counts every '{' and '}' it sees, including those inside
// string values, so a message text with unbalanced braces can cut the
// returned span short.
namespace ErrorExtractor {
    std::optional<QByteArray> extract(const QByteArray& body);

    // Returns the length of the balanced object starting at text[from],
    // or -1 when the braces never close.
    qsizetype matchBraces(const QByteArray& text, qsizetype from = 0);
}
