#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QString type;
    QByteArray data;
};

// Incremental text/event-stream parser. Bytes may arrive split at any
// position; an event is produced once its terminating blank line is seen.
class SseParser {
public:
    QList<SseEvent> feed(const QByteArray& bytes);

    // Parses whatever is left in the buffer as a final block.
    QList<SseEvent> flush();

    bool hasPendingData() const { return !m_buffer.trimmed().isEmpty(); }

private:
    QByteArray m_buffer;

    void parseBlocks(QList<SseEvent>& out);
    static void parseBlock(const QByteArray& block, QList<SseEvent>& out);
};
