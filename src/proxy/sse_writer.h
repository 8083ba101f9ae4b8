#pragma once
#include <QTcpSocket>
#include <QByteArray>

class SseWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket, int status = 200,
                                  const QByteArray& reason = "OK");
    // Writes bytes that are already SSE-framed.
    static void sendChunk(QTcpSocket* socket, const QByteArray& sseData);
    // Frames payload as a single "data:" event.
    static void sendEvent(QTcpSocket* socket, const QByteArray& payload);
    static void sendDone(QTcpSocket* socket);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
};
