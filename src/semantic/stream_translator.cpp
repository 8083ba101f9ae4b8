#include "stream_translator.h"
#include "core/log_manager.h"

StreamTranslator::StreamTranslator(const QString& model, qint64 created)
    : m_model(model)
    , m_created(created)
{
}

bool StreamTranslator::isTerminalReason(const QString& finishReason)
{
    return !finishReason.isEmpty() && finishReason != QLatin1String("null");
}

StandardChunk StreamTranslator::makeChunk() const
{
    StandardChunk chunk;
    chunk.id = m_cursor.streamId;
    chunk.created = m_created;
    chunk.model = m_model;
    return chunk;
}

StreamTranslator::Output StreamTranslator::consume(const NativeResponse& frame)
{
    Output out;
    if (m_state == StreamState::Done)
        return out;

    if (m_cursor.streamId.isEmpty()) {
        if (!frame.requestId.isEmpty())
            m_cursor.streamId = frame.requestId;
        else if (!frame.output.sessionId.isEmpty())
            m_cursor.streamId = frame.output.sessionId;
    }

    const QString& text = frame.output.text;
    if (text.size() > m_cursor.lastLength) {
        StandardChunk chunk = makeChunk();
        chunk.deltaContent = text.mid(m_cursor.lastLength);
        m_cursor.lastLength = text.size();
        out.chunks.append(chunk);
    } else if (text.size() < m_cursor.lastLength) {
        LOG_DEBUG(QStringLiteral("Cumulative text shrank from %1 to %2, no delta emitted")
                      .arg(m_cursor.lastLength).arg(text.size()));
    }

    if (isTerminalReason(frame.output.finishReason)) {
        StandardChunk last = makeChunk();
        last.finishReason = frame.output.finishReason;
        if (!frame.usage.isEmpty()) {
            const NativeModelUsage& u = frame.usage.first();
            last.usage = UsageEntry{u.inputTokens, u.outputTokens,
                                    u.inputTokens + u.outputTokens};
        }
        out.chunks.append(last);
        out.sentinel = true;
        m_state = StreamState::Done;
    }

    return out;
}

bool StreamTranslator::endOfInput()
{
    if (m_state == StreamState::Done)
        return false;
    m_state = StreamState::Done;
    return true;
}
