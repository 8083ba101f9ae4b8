#include <QTest>
#include <QPointer>
#include <QTcpSocket>
#include <QJsonDocument>
#include <QJsonObject>
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/bailian.h"
#include "pipeline/pipeline.h"
#include "proxy/proxy_server.h"
#include "fake_reply.h"

class CannedExecutor : public IExecutor {
public:
    Result<ProviderResponse> execute(const ProviderRequest&) override {
        return response;
    }

    Result<ProviderStream> connectStream(const ProviderRequest&) override {
        ProviderStream ps;
        ps.statusCode = streamStatus;
        if (streamStatus >= 200 && streamStatus < 300) {
            auto* reply = new FakeReply;
            reply->abortCounter = &aborts;
            reply->push(streamBody);
            if (!holdOpen)
                reply->complete();
            lastReply = reply;
            ps.reply = reply;
        } else {
            ps.errorBody = streamBody;
        }
        return ps;
    }

    Result<ProviderResponse> response = ProviderResponse{};
    int streamStatus = 200;
    QByteArray streamBody;
    bool holdOpen = false;
    int aborts = 0;
    QPointer<FakeReply> lastReply;
};

struct HttpAnswer {
    int status = 0;
    QByteArray head;
    QByteArray body;
};

class TestProxyServer : public QObject {
    Q_OBJECT

private:
    OpenAIChatAdapter m_inbound;
    std::unique_ptr<BailianOutbound> m_outbound;
    CannedExecutor m_executor;
    std::unique_ptr<Pipeline> m_pipeline;
    std::unique_ptr<ProxyServer> m_server;

    // Sends one raw request and collects the answer; a chunked answer is
    // complete once its terminating chunk arrives.
    HttpAnswer send(const QByteArray& raw) {
        QTcpSocket client;
        client.connectToHost(QHostAddress::LocalHost, m_server->serverPort());
        if (!QTest::qWaitFor([&client]() {
                return client.state() == QAbstractSocket::ConnectedState; }, 3000))
            return {};

        client.write(raw);
        QByteArray data;
        const bool complete = QTest::qWaitFor([&client, &data]() {
            data.append(client.readAll());
            const qsizetype headEnd = data.indexOf("\r\n\r\n");
            if (headEnd < 0)
                return false;
            const QByteArray head = data.left(headEnd).toLower();
            if (head.contains("transfer-encoding: chunked"))
                return data.endsWith("0\r\n\r\n");
            const qsizetype lenPos = head.indexOf("content-length:");
            if (lenPos < 0)
                return true;
            const qsizetype lenEnd = head.indexOf("\r\n", lenPos);
            const int length = head.mid(lenPos + 15, lenEnd < 0 ? -1 : lenEnd - lenPos - 15)
                                   .trimmed().toInt();
            return data.size() >= headEnd + 4 + length;
        }, 5000);

        HttpAnswer answer;
        if (!complete)
            return answer;
        const qsizetype headEnd = data.indexOf("\r\n\r\n");
        if (headEnd < 0)
            return answer;
        answer.head = data.left(headEnd);
        answer.body = data.mid(headEnd + 4);
        const QList<QByteArray> statusLine = answer.head.split('\r').first().split(' ');
        if (statusLine.size() >= 2)
            answer.status = statusLine.at(1).toInt();
        return answer;
    }

    static QByteArray post(const QByteArray& path, const QByteArray& body) {
        return "POST " + path + " HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\n"
               "Content-Length: " + QByteArray::number(body.size()) + "\r\n\r\n" + body;
    }

private slots:
    void init() {
        GatewayConfig config;
        config.upstream.appId = QStringLiteral("app-1");
        config.upstream.apiKey = QStringLiteral("sk-1");
        config.runtime.port = 0;

        m_outbound = std::make_unique<BailianOutbound>(config.upstream);
        m_executor.response = ProviderResponse{};
        m_executor.streamStatus = 200;
        m_executor.streamBody.clear();
        m_executor.holdOpen = false;
        m_executor.aborts = 0;
        m_executor.lastReply.clear();
        m_pipeline = std::make_unique<Pipeline>(&m_inbound, m_outbound.get(), &m_executor);
        m_server = std::make_unique<ProxyServer>();
        m_server->setPipeline(m_pipeline.get());
        QVERIFY(m_server->start(config));
        QVERIFY(m_server->isRunning());
    }

    void cleanup() {
        m_server->stop();
        m_server.reset();
        m_pipeline.reset();
    }

    void testHealth() {
        HttpAnswer answer = send("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QCOMPARE(answer.status, 200);
        QJsonObject obj = QJsonDocument::fromJson(answer.body).object();
        QCOMPARE(obj[QStringLiteral("status")].toString(), QStringLiteral("ok"));
        QCOMPARE(obj[QStringLiteral("service")].toString(), QStringLiteral("aliyun-bailian-proxy"));
    }

    void testUnknownPath() {
        HttpAnswer answer = send("GET /v1/models HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QCOMPARE(answer.status, 404);
    }

    void testWrongMethod() {
        HttpAnswer answer = send("GET /v1/chat/completions HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QCOMPARE(answer.status, 405);
        QJsonObject err = QJsonDocument::fromJson(answer.body).object()[QStringLiteral("error")].toObject();
        QCOMPARE(err[QStringLiteral("message")].toString(), QStringLiteral("只支持POST请求"));
    }

    void testInvalidBody() {
        HttpAnswer answer = send(post("/v1/chat/completions", "{oops"));
        QCOMPARE(answer.status, 400);
        QJsonObject err = QJsonDocument::fromJson(answer.body).object()[QStringLiteral("error")].toObject();
        QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("invalid_request_error"));
    }

    void testNegativeContentLength() {
        HttpAnswer answer = send("POST /v1/chat/completions HTTP/1.1\r\nHost: localhost\r\n"
                                 "Content-Length: -999999\r\n\r\n");
        QCOMPARE(answer.status, 400);
        QVERIFY(answer.body.contains("invalid_content_length"));

        // The listener keeps serving other clients
        QCOMPARE(send("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n").status, 200);
    }

    void testNonNumericContentLength() {
        HttpAnswer answer = send("POST /v1/chat/completions HTTP/1.1\r\nHost: localhost\r\n"
                                 "Content-Length: lots\r\n\r\n");
        QCOMPARE(answer.status, 400);
    }

    void testBufferedCompletion() {
        ProviderResponse backend;
        backend.statusCode = 200;
        backend.headers[QStringLiteral("Content-Length")] = QStringLiteral("9999");
        backend.headers[QStringLiteral("X-Request-Id")] = QStringLiteral("req-5");
        backend.body = R"({"output":{"text":"Hello!","finish_reason":"stop"},"request_id":"req-5"})";
        m_executor.response = backend;

        HttpAnswer answer = send(post("/v1/chat/completions",
                                      R"({"model":"m","messages":[{"role":"user","content":"Hi"}]})"));
        QCOMPARE(answer.status, 200);
        QVERIFY(answer.head.contains("X-Request-Id: req-5"));
        QVERIFY(!answer.head.contains("9999"));
        QJsonObject obj = QJsonDocument::fromJson(answer.body).object();
        QCOMPARE(obj[QStringLiteral("id")].toString(), QStringLiteral("req-5"));
    }

    void testStreamingCompletion() {
        m_executor.streamBody =
            "data:{\"output\":{\"text\":\"Hi\",\"finish_reason\":\"null\"},\"request_id\":\"r\"}\n\n"
            "data:{\"output\":{\"text\":\"Hi!\",\"finish_reason\":\"stop\"},\"request_id\":\"r\"}\n\n";

        HttpAnswer answer = send(post("/v1/chat/completions",
            R"({"model":"m","stream":true,"messages":[{"role":"user","content":"Hi"}]})"));
        QCOMPARE(answer.status, 200);
        QVERIFY(answer.head.contains("Content-Type: text/event-stream"));
        QVERIFY(answer.body.contains("\"content\":\"Hi\""));
        QVERIFY(answer.body.contains("\"content\":\"!\""));
        QVERIFY(answer.body.contains("\"finish_reason\":\"stop\""));
        QVERIFY(answer.body.contains("data: [DONE]\n\n"));
        QVERIFY(answer.body.endsWith("0\r\n\r\n"));
    }

    void testTruncatedStreamHasNoDone() {
        m_executor.streamBody =
            "data:{\"output\":{\"text\":\"Hi\",\"finish_reason\":\"null\"},\"request_id\":\"r\"}\n\n";

        HttpAnswer answer = send(post("/v1/chat/completions",
            R"({"stream":true,"messages":[{"role":"user","content":"Hi"}]})"));
        QCOMPARE(answer.status, 200);
        QVERIFY(answer.body.contains("\"content\":\"Hi\""));
        QVERIFY(!answer.body.contains("[DONE]"));
    }

    void testClientDisconnectAbortsBackend() {
        m_executor.holdOpen = true;
        m_executor.streamBody =
            "data:{\"output\":{\"text\":\"Hi\",\"finish_reason\":\"null\"},\"request_id\":\"r\"}\n\n";

        QTcpSocket client;
        client.connectToHost(QHostAddress::LocalHost, m_server->serverPort());
        QVERIFY(QTest::qWaitFor([&client]() {
            return client.state() == QAbstractSocket::ConnectedState; }, 3000));
        client.write(post("/v1/chat/completions",
            R"({"stream":true,"messages":[{"role":"user","content":"Hi"}]})"));

        QByteArray received;
        QVERIFY(QTest::qWaitFor([&client, &received]() {
            received.append(client.readAll());
            return received.contains("\"content\":\"Hi\"");
        }, 5000));
        QCOMPARE(m_server->activeStreamCount(), 1);
        QVERIFY(m_executor.lastReply);
        QCOMPARE(m_executor.aborts, 0);

        client.disconnectFromHost();
        QVERIFY(QTest::qWaitFor([this]() {
            return m_server->activeStreamCount() == 0; }, 5000));
        QVERIFY(m_executor.aborts > 0);

        // Late backend data goes nowhere
        if (m_executor.lastReply)
            m_executor.lastReply->push(
                "data:{\"output\":{\"text\":\"Hi!\",\"finish_reason\":\"stop\"},\"request_id\":\"r\"}\n\n");
        QVERIFY(QTest::qWaitFor([this]() { return m_executor.lastReply.isNull(); }, 5000));
        QVERIFY(!received.contains("[DONE]"));
    }

    void testStreamRefusedSendsErrorEvent() {
        m_executor.streamStatus = 429;
        m_executor.streamBody = R"({"code":"Throttling","message":"slow down"})";

        HttpAnswer answer = send(post("/v1/chat/completions",
            R"({"stream":true,"messages":[{"role":"user","content":"Hi"}]})"));
        QCOMPARE(answer.status, 200);
        QVERIFY(answer.body.contains("rate_limit_error"));
        QVERIFY(answer.body.contains("slow down"));
        QVERIFY(!answer.body.contains("[DONE]"));
    }
};

QTEST_MAIN(TestProxyServer)
#include "tst_proxy_server.moc"
