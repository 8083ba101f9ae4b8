#pragma once
#include "native.h"
#include "response.h"
#include "types.h"
#include <QList>

// Per-exchange reconciliation state between the backend's cumulative text
// and the deltas already handed to the client.
struct StreamCursor {
    qsizetype lastLength = 0;   // UTF-16 code units already emitted
    QString streamId;           // latched from the first frame carrying one
};

// Turns cumulative native frames into standard delta chunks.
// One instance per streaming exchange; never shared.
class StreamTranslator {
public:
    struct Output {
        QList<StandardChunk> chunks;
        bool sentinel = false;  // the [DONE] marker follows the chunks
    };

    StreamTranslator(const QString& model, qint64 created);

    // Frames arriving after the terminal frame are ignored.
    Output consume(const NativeResponse& frame);

    // Marks the end of the backend body. Returns true when the stream ended
    // without a terminal frame.
    bool endOfInput();

    StreamState state() const { return m_state; }
    const StreamCursor& cursor() const { return m_cursor; }

    static bool isTerminalReason(const QString& finishReason);

private:
    StandardChunk makeChunk() const;

    QString m_model;
    qint64 m_created;
    StreamCursor m_cursor;
    StreamState m_state = StreamState::Streaming;
};
