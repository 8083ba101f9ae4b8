#pragma once
#include "ports.h"
#include "native.h"
#include "response.h"
#include "sse_parser.h"
#include "stream_translator.h"
#include <QObject>
#include <QNetworkReply>
#include <QTimer>
#include <functional>
#include <memory>

using FrameParser = std::function<Result<NativeResponse>(const QByteArray&)>;

// Drives one live backend stream. With a translator, native frames are
// parsed and turned into delta chunks; without one, the backend bytes are
// relayed untouched.
class StreamSession : public QObject {
    Q_OBJECT
public:
    StreamSession(QNetworkReply* reply,
                  FrameParser parser,
                  std::unique_ptr<StreamTranslator> translator,
                  QDeadlineTimer deadline,
                  QObject* parent = nullptr);
    ~StreamSession() override;

    // Processes data that arrived before the session was connected.
    void start();
    void abort();

    bool isPassthrough() const { return !m_translator; }
    const StreamTranslator* translator() const { return m_translator.get(); }

signals:
    void chunkReady(const StandardChunk& chunk);
    void rawDataReady(const QByteArray& data);
    void finished(StreamEnd end);
    void error(const DomainFailure& failure);

private slots:
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);
    void onDeadline();

private:
    QNetworkReply* m_reply;
    FrameParser m_parser;
    std::unique_ptr<StreamTranslator> m_translator;
    SseParser m_sse;
    QDeadlineTimer m_deadline;
    QTimer m_deadlineTimer;
    bool m_finished = false;

    void handleEvents(const QList<SseEvent>& events);
    void finish(StreamEnd end);
    void fail(const DomainFailure& failure);
};
