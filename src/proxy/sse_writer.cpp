#include "sse_writer.h"
#include "core/log_manager.h"

void SseWriter::writeStreamHeader(QTcpSocket* socket, int status, const QByteArray& reason)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot write stream header, socket not connected"));
        return;
    }

    QByteArray header = "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n";
    header.append(
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "X-Accel-Buffering: no\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n");

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void SseWriter::sendChunk(QTcpSocket* socket, const QByteArray& sseData)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot send chunk, socket not connected"));
        return;
    }
    if (sseData.isEmpty())
        return; // a zero-length chunk would end the body

    socket->write(wrapChunked(sseData));
    socket->flush();
}

void SseWriter::sendEvent(QTcpSocket* socket, const QByteArray& payload)
{
    QByteArray sseFrame("data: ");
    sseFrame.append(payload);
    sseFrame.append("\n\n");
    sendChunk(socket, sseFrame);
}

void SseWriter::sendDone(QTcpSocket* socket)
{
    sendChunk(socket, "data: [DONE]\n\n");
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot send terminator, socket not connected"));
        return;
    }

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}
