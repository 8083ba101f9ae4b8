#include "sse_parser.h"

QList<SseEvent> SseParser::feed(const QByteArray& bytes)
{
    QList<SseEvent> events;
    m_buffer.append(bytes);
    parseBlocks(events);
    return events;
}

QList<SseEvent> SseParser::flush()
{
    QList<SseEvent> events;
    if (!m_buffer.isEmpty()) {
        m_buffer.append("\n\n");
        parseBlocks(events);
        m_buffer.clear();
    }
    return events;
}

void SseParser::parseBlocks(QList<SseEvent>& out)
{
    while (true) {
        // "\r\n\r\n" is checked first so that a CRLF stream is not split
        // on the inner "\n\r\n".
        qsizetype delimPos = -1;
        qsizetype delimLen = 0;

        const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
        const qsizetype lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);
        parseBlock(block, out);
    }
}

void SseParser::parseBlock(const QByteArray& block, QList<SseEvent>& out)
{
    QString eventType;
    QList<QByteArray> dataLines;

    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray& rawLine : lines) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            eventType = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            dataLines.append(line.mid(5).trimmed());
        }
        // id: and retry: are not used; unknown fields are ignored
    }

    if (dataLines.isEmpty())
        return;

    SseEvent event;
    event.type = eventType;
    event.data = dataLines.join('\n');
    out.append(event);
}
