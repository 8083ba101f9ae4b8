#include "pipeline.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/bailian.h"
#include "core/log_manager.h"
#include "semantic/stream_session.h"
#include "semantic/stream_translator.h"
#include "semantic/validate.h"
#include <QDateTime>

// ========== PipelineStreamSession ==========

PipelineStreamSession::PipelineStreamSession(
        StreamSession* upstream,
        const OpenAIChatAdapter* inbound,
        const QList<IPipelineMiddleware*>& middlewares,
        QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_inbound(inbound)
    , m_middlewares(middlewares)
{
    m_upstream->setParent(this);
    connect(m_upstream, &StreamSession::chunkReady,
            this, &PipelineStreamSession::onUpstreamChunk);
    connect(m_upstream, &StreamSession::rawDataReady,
            this, &PipelineStreamSession::onUpstreamRawData);
    connect(m_upstream, &StreamSession::finished,
            this, &PipelineStreamSession::onUpstreamFinished);
    connect(m_upstream, &StreamSession::error,
            this, &PipelineStreamSession::onUpstreamError);
}

void PipelineStreamSession::start() {
    if (m_upstream) m_upstream->start();
}

void PipelineStreamSession::abort() {
    if (m_upstream) m_upstream->abort();
}

bool PipelineStreamSession::isPassthrough() const {
    return m_upstream && m_upstream->isPassthrough();
}

void PipelineStreamSession::onUpstreamChunk(const StandardChunk& chunk) {
    StandardChunk c = chunk;
    for (auto* mw : m_middlewares) {
        auto r = mw->onChunk(std::move(c));
        if (r) {
            c = *r;
        } else {
            m_upstream->abort();
            emit error(r.error());
            return;
        }
    }

    QByteArray frame("data: ");
    frame.append(m_inbound->encodeChunk(c));
    frame.append("\n\n");
    emit encodedFrameReady(frame);
}

void PipelineStreamSession::onUpstreamRawData(const QByteArray& data) {
    emit encodedFrameReady(data);
}

void PipelineStreamSession::onUpstreamFinished(StreamEnd end) {
    emit finished(end);
}

void PipelineStreamSession::onUpstreamError(const DomainFailure& failure) {
    emit error(failure);
}

// ========== Pipeline ==========

Pipeline::Pipeline(const OpenAIChatAdapter* inbound,
                   const BailianOutbound* outbound,
                   IExecutor* executor,
                   QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_outbound(outbound)
    , m_executor(executor)
{
}

void Pipeline::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

QString Pipeline::truncateForLog(const QByteArray& body, int limit) {
    const QString text = QString::fromUtf8(body);
    if (text.size() <= limit)
        return text;
    return text.left(limit) + QStringLiteral("...(truncated)");
}

Result<ChatRequest> Pipeline::decode(const QByteArray& requestBody,
                                     const QMap<QString, QString>& metadata) {
    auto decoded = m_inbound->decodeRequest(requestBody, metadata);
    if (!decoded) return std::unexpected(decoded.error());

    VoidResult valid = Validate::request(*decoded);
    if (!valid) return std::unexpected(valid.error());

    ChatRequest req = *decoded;

    // Forward through middlewares in order
    for (auto& mw : m_middlewares) {
        auto r = mw->onRequest(std::move(req));
        if (!r) return std::unexpected(r.error());
        req = *r;
    }
    return req;
}

ProviderRequest Pipeline::buildProviderRequest(const ChatRequest& request,
                                               const QByteArray& requestBody) const {
    ProviderRequest pr = m_outbound->config().useNativeApi
        ? m_outbound->buildRequest(request)
        : m_outbound->buildCompatibleRequest(requestBody, request.stream,
                                             request.metadata.value(QStringLiteral("accept")));

    LOG_INFO(QStringLiteral("Pipeline: forwarding to %1").arg(pr.url));
    LOG_INFO(QStringLiteral("Pipeline: request body: %1").arg(truncateForLog(pr.body)));
    return pr;
}

PipelineReply Pipeline::translateReply(const ChatRequest& request,
                                       const ProviderResponse& response) {
    PipelineReply reply;
    reply.statusCode = response.statusCode;
    reply.headers = response.headers;
    reply.body = response.body;

    if (!m_outbound->config().useNativeApi)
        return reply;

    if (response.statusCode < 200 || response.statusCode >= 300) {
        const DomainFailure failure = m_outbound->mapFailure(response.statusCode, response.body);
        reply.body = m_inbound->encodeFailure(failure);
        LOG_WARNING(QStringLiteral("Pipeline: backend error %1 [%2]: %3")
                        .arg(response.statusCode)
                        .arg(failure.code, failure.message));
        return reply;
    }

    auto parsed = m_outbound->parseResponse(response, request.model);
    if (!parsed) {
        LOG_WARNING(QStringLiteral("Pipeline: %1, forwarding raw backend body")
                        .arg(parsed.error().message));
        return reply;
    }

    StandardResponse sr = *parsed;
    if (sr.id.isEmpty())
        sr.id = OpenAIChatAdapter::generateChatId();

    // Reverse through middlewares
    for (auto* mw : reversedMiddlewares()) {
        auto r = mw->onResponse(std::move(sr));
        if (!r) {
            reply.statusCode = r.error().httpStatus();
            reply.body = m_inbound->encodeFailure(r.error());
            return reply;
        }
        sr = *r;
    }

    reply.body = m_inbound->encodeResponse(sr);
    LOG_INFO(QStringLiteral("Pipeline: response translated, input_tokens=%1 output_tokens=%2")
                 .arg(sr.usage.promptTokens)
                 .arg(sr.usage.completionTokens));
    return reply;
}

Result<PipelineReply> Pipeline::process(const QByteArray& requestBody,
                                        const QMap<QString, QString>& metadata) {
    auto decoded = decode(requestBody, metadata);
    if (!decoded) return std::unexpected(decoded.error());

    const ChatRequest& req = *decoded;
    auto resp = m_executor->execute(buildProviderRequest(req, requestBody));
    if (!resp) return std::unexpected(resp.error());

    LOG_INFO(QStringLiteral("Pipeline: backend status %1").arg(resp->statusCode));
    return translateReply(req, *resp);
}

Result<PipelineStreamSession*> Pipeline::processStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata) {
    auto decoded = decode(requestBody, metadata);
    if (!decoded) return std::unexpected(decoded.error());

    ChatRequest req = *decoded;
    req.stream = true;
    const bool native = m_outbound->config().useNativeApi;

    auto stream = m_executor->connectStream(buildProviderRequest(req, requestBody));
    if (!stream) return std::unexpected(stream.error());

    if (!stream->reply) {
        LOG_WARNING(QStringLiteral("Pipeline: backend stream refused with status %1")
                        .arg(stream->statusCode));
        if (!native)
            return std::unexpected(DomainFailure::passthrough(stream->statusCode, stream->errorBody));
        return std::unexpected(m_outbound->mapFailure(stream->statusCode, stream->errorBody));
    }

    std::unique_ptr<StreamTranslator> translator;
    if (native) {
        translator = std::make_unique<StreamTranslator>(
            req.model, QDateTime::currentSecsSinceEpoch());
    }

    auto* session = new StreamSession(stream->reply, &BailianOutbound::parseFrame,
                                      std::move(translator), stream->deadline);
    return new PipelineStreamSession(session, m_inbound, reversedMiddlewares(), this);
}

QList<IPipelineMiddleware*> Pipeline::reversedMiddlewares() const {
    QList<IPipelineMiddleware*> list;
    list.reserve(m_middlewares.size());
    for (int i = static_cast<int>(m_middlewares.size()) - 1; i >= 0; --i)
        list.append(m_middlewares[i].get());
    return list;
}
