#include "stream_session.h"
#include "core/log_manager.h"

StreamSession::StreamSession(QNetworkReply* reply,
                             FrameParser parser,
                             std::unique_ptr<StreamTranslator> translator,
                             QDeadlineTimer deadline,
                             QObject* parent)
    : QObject(parent)
    , m_reply(reply)
    , m_parser(std::move(parser))
    , m_translator(std::move(translator))
    , m_deadline(deadline)
{
    Q_ASSERT(m_reply);

    // Take ownership of the reply so it is cleaned up with this session
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamSession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamSession::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &StreamSession::onReplyError);

    m_deadlineTimer.setSingleShot(true);
    connect(&m_deadlineTimer, &QTimer::timeout,
            this, &StreamSession::onDeadline);
}

StreamSession::~StreamSession()
{
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
}

void StreamSession::start()
{
    if (!m_deadline.isForever())
        m_deadlineTimer.start(static_cast<int>(qMax<qint64>(0, m_deadline.remainingTime())));

    // Bytes read while the executor waited for headers have already
    // signalled readyRead; pick them up from the event loop.
    QTimer::singleShot(0, this, [this]() {
        if (m_finished || !m_reply)
            return;
        if (m_reply->bytesAvailable() > 0)
            onReadyRead();
        if (!m_finished && m_reply->isFinished()) {
            if (m_reply->error() != QNetworkReply::NoError)
                onReplyError(m_reply->error());
            else
                onReplyFinished();
        }
    });
}

void StreamSession::abort()
{
    if (m_finished)
        return;
    m_finished = true;
    m_deadlineTimer.stop();
    if (m_reply) {
        m_reply->abort();
    }
}

void StreamSession::onReadyRead()
{
    if (!m_reply || m_finished) return;
    const QByteArray data = m_reply->readAll();
    if (data.isEmpty()) return;

    if (isPassthrough()) {
        emit rawDataReady(data);
        return;
    }
    handleEvents(m_sse.feed(data));
}

void StreamSession::handleEvents(const QList<SseEvent>& events)
{
    for (const SseEvent& event : events) {
        if (m_finished)
            return;

        // Keep-alive and status payloads carry no frame
        if (!event.data.startsWith('{'))
            continue;

        Result<NativeResponse> frame = m_parser(event.data);
        if (!frame) {
            LOG_WARNING(QStringLiteral("StreamSession: skipping malformed frame: %1 (%2)")
                            .arg(frame.error().message,
                                 QString::fromUtf8(event.data.left(100))));
            continue;
        }

        const StreamTranslator::Output out = m_translator->consume(frame.value());
        for (const StandardChunk& chunk : out.chunks)
            emit chunkReady(chunk);

        if (out.sentinel) {
            finish(StreamEnd::Completed);
            return;
        }
    }
}

void StreamSession::onReplyFinished()
{
    if (m_finished) return;

    if (isPassthrough()) {
        const QByteArray rest = m_reply ? m_reply->readAll() : QByteArray();
        if (!rest.isEmpty())
            emit rawDataReady(rest);
        finish(StreamEnd::Completed);
        return;
    }

    if (m_reply)
        handleEvents(m_sse.feed(m_reply->readAll()));
    if (!m_finished)
        handleEvents(m_sse.flush());
    if (m_finished)
        return;

    if (m_translator->endOfInput()) {
        LOG_WARNING(QStringLiteral("StreamSession: backend closed the stream without a terminal frame (%1 chars sent)")
                        .arg(m_translator->cursor().lastLength));
        finish(StreamEnd::Truncated);
    } else {
        finish(StreamEnd::Completed);
    }
}

void StreamSession::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_finished) return;

    DomainFailure failure;
    switch (code) {
    case QNetworkReply::NoError:
        return;

    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        failure = DomainFailure::timeout(QStringLiteral("请求超时，请稍后重试"));
        break;

    default:
        failure = DomainFailure::unavailable(
            QStringLiteral("读取流式响应失败: %1").arg(
                m_reply ? m_reply->errorString() : QStringLiteral("unknown")));
        break;
    }

    fail(failure);
}

void StreamSession::onDeadline()
{
    if (m_finished) return;
    LOG_WARNING(QStringLiteral("StreamSession: stream deadline reached, aborting backend read"));
    fail(DomainFailure::timeout(QStringLiteral("请求超时，请稍后重试")));
}

void StreamSession::finish(StreamEnd end)
{
    if (m_finished) return;
    m_finished = true;
    m_deadlineTimer.stop();

    // Stop consuming; whatever the backend still sends is not needed
    if (m_reply && m_reply->isRunning())
        m_reply->abort();

    emit finished(end);
}

void StreamSession::fail(const DomainFailure& failure)
{
    if (m_finished) return;
    m_finished = true;
    m_deadlineTimer.stop();

    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2")
                  .arg(failure.errorType(), failure.message));

    if (m_reply && m_reply->isRunning())
        m_reply->abort();

    emit error(failure);
}
