#pragma once
#include "middleware.h"
#include "semantic/ports.h"
#include <QObject>
#include <QList>
#include <memory>
#include <vector>

class StreamSession;
class OpenAIChatAdapter;
class BailianOutbound;

// Buffered answer for the client. Headers are the backend's; the proxy
// decides which of them to copy.
struct PipelineReply {
    int statusCode = 200;
    QMap<QString, QString> headers;
    QByteArray body;
};

class PipelineStreamSession : public QObject {
    Q_OBJECT
public:
    PipelineStreamSession(StreamSession* upstream,
                          const OpenAIChatAdapter* inbound,
                          const QList<IPipelineMiddleware*>& middlewares,
                          QObject* parent = nullptr);

    void start();
    void abort();
    bool isPassthrough() const;

signals:
    // Complete SSE bytes, ready for the wire
    void encodedFrameReady(const QByteArray& sseData);
    void finished(StreamEnd end);
    void error(const DomainFailure& failure);

private slots:
    void onUpstreamChunk(const StandardChunk& chunk);
    void onUpstreamRawData(const QByteArray& data);
    void onUpstreamFinished(StreamEnd end);
    void onUpstreamError(const DomainFailure& failure);

private:
    StreamSession* m_upstream;
    const OpenAIChatAdapter* m_inbound;
    QList<IPipelineMiddleware*> m_middlewares;
};

class Pipeline : public QObject {
    Q_OBJECT
public:
    Pipeline(const OpenAIChatAdapter* inbound,
             const BailianOutbound* outbound,
             IExecutor* executor,
             QObject* parent = nullptr);

    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);

    // Fails only for client errors and transport errors; backend error
    // statuses come back as a reply carrying the translated envelope.
    Result<PipelineReply> process(const QByteArray& requestBody,
                                  const QMap<QString, QString>& metadata);

    Result<PipelineStreamSession*> processStream(
        const QByteArray& requestBody,
        const QMap<QString, QString>& metadata);

    static QString truncateForLog(const QByteArray& body, int limit = 500);

private:
    const OpenAIChatAdapter* m_inbound;
    const BailianOutbound* m_outbound;
    IExecutor* m_executor;
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;

    Result<ChatRequest> decode(const QByteArray& requestBody,
                               const QMap<QString, QString>& metadata);
    ProviderRequest buildProviderRequest(const ChatRequest& request,
                                         const QByteArray& requestBody) const;
    PipelineReply translateReply(const ChatRequest& request,
                                 const ProviderResponse& response);
    QList<IPipelineMiddleware*> reversedMiddlewares() const;
};
