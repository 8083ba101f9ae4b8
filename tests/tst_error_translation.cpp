#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include "adapters/outbound/bailian.h"
#include "adapters/executor/qt_executor.h"
#include "semantic/error_extractor.h"
#include "semantic/failure.h"

class TestErrorTranslation : public QObject {
    Q_OBJECT

private slots:
    void testTypeForStatus_data() {
        QTest::addColumn<int>("status");
        QTest::addColumn<QString>("type");

        QTest::newRow("400") << 400 << QStringLiteral("invalid_request_error");
        QTest::newRow("401") << 401 << QStringLiteral("authentication_error");
        QTest::newRow("403") << 403 << QStringLiteral("permission_error");
        QTest::newRow("404") << 404 << QStringLiteral("invalid_request_error");
        QTest::newRow("429") << 429 << QStringLiteral("rate_limit_error");
        QTest::newRow("500") << 500 << QStringLiteral("server_error");
        QTest::newRow("502") << 502 << QStringLiteral("server_error");
        QTest::newRow("503") << 503 << QStringLiteral("server_error");
        QTest::newRow("418") << 418 << QStringLiteral("api_error");
        QTest::newRow("999") << 999 << QStringLiteral("api_error");
    }

    void testTypeForStatus() {
        QFETCH(int, status);
        QFETCH(QString, type);
        QCOMPARE(DomainFailure::typeForStatus(status), type);
    }

    void testLocalFailureStatuses() {
        QCOMPARE(DomainFailure::invalidInput(QStringLiteral("c"), QStringLiteral("m")).httpStatus(), 400);
        QCOMPARE(DomainFailure::notFound(QStringLiteral("m")).httpStatus(), 404);
        QCOMPARE(DomainFailure::methodNotAllowed(QStringLiteral("m")).httpStatus(), 405);
        QCOMPARE(DomainFailure::timeout(QStringLiteral("m")).httpStatus(), 504);
        QCOMPARE(DomainFailure::unavailable(QStringLiteral("m")).httpStatus(), 500);
        QCOMPARE(DomainFailure::internal(QStringLiteral("m")).httpStatus(), 500);
        QCOMPARE(DomainFailure::upstream(429, {}, QStringLiteral("m")).httpStatus(), 429);
    }

    void testEnvelopeOmitsEmptyCode() {
        DomainFailure f = DomainFailure::timeout(QStringLiteral("请求超时，请稍后重试"));
        QJsonObject err = QJsonDocument::fromJson(f.toBody()).object()[QStringLiteral("error")].toObject();
        QCOMPARE(err[QStringLiteral("message")].toString(), QStringLiteral("请求超时，请稍后重试"));
        QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("timeout_error"));
        QVERIFY(!err.contains(QStringLiteral("code")));
    }

    void testPassthroughBody() {
        DomainFailure f = DomainFailure::passthrough(503, "upstream down");
        QCOMPARE(f.httpStatus(), 503);
        QCOMPARE(f.toBody(), QByteArray("upstream down"));
    }

    void testExtractWholeObject() {
        const QByteArray body = R"({"code":"InvalidApiKey","message":"bad key"})";
        auto json = ErrorExtractor::extract(body);
        QVERIFY(json.has_value());
        QCOMPARE(*json, body);
    }

    void testExtractLastDataLine() {
        const QByteArray body =
            "event:result\n"
            "data:{\"code\":\"First\",\"message\":\"one\"}\n"
            "\n"
            "event:error\n"
            "data:{\"code\":\"Throttling\",\"message\":\"Requests throttled\"} trailing\n";

        auto json = ErrorExtractor::extract(body);
        QVERIFY(json.has_value());
        QCOMPARE(*json, QByteArray("{\"code\":\"Throttling\",\"message\":\"Requests throttled\"}"));
    }

    void testExtractEmbeddedObject() {
        const QByteArray body = "gateway said: {\"code\":\"X\",\"message\":{\"nested\":1}} end";
        auto json = ErrorExtractor::extract(body);
        QVERIFY(json.has_value());
        QCOMPARE(*json, QByteArray("{\"code\":\"X\",\"message\":{\"nested\":1}}"));
    }

    void testExtractNothing() {
        QVERIFY(!ErrorExtractor::extract("plain text failure").has_value());
        QVERIFY(!ErrorExtractor::extract("unbalanced { here").has_value());
    }

    void testMatchBraces() {
        QCOMPARE(ErrorExtractor::matchBraces("{a{b}c}xyz"), 7);
        QCOMPARE(ErrorExtractor::matchBraces("{open"), -1);
        QCOMPARE(ErrorExtractor::matchBraces("ab{}", 2), 2);
    }

    void testMapFailureFromJson() {
        BailianOutbound outbound(UpstreamConfig{});
        DomainFailure f = outbound.mapFailure(
            401, R"({"code":"InvalidApiKey","message":"Invalid API-key provided.","request_id":"r"})");

        QCOMPARE(f.kind, ErrorKind::Upstream);
        QCOMPARE(f.httpStatus(), 401);
        QJsonObject err = QJsonDocument::fromJson(f.toBody()).object()[QStringLiteral("error")].toObject();
        QCOMPARE(err[QStringLiteral("message")].toString(), QStringLiteral("Invalid API-key provided."));
        QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("authentication_error"));
        QCOMPARE(err[QStringLiteral("code")].toString(), QStringLiteral("InvalidApiKey"));
    }

    void testMapFailureFromEventStream() {
        BailianOutbound outbound(UpstreamConfig{});
        DomainFailure f = outbound.mapFailure(
            429, "id:1\nevent:error\ndata:{\"code\":\"Throttling\",\"message\":\"slow down\"}\n\n");

        QCOMPARE(f.httpStatus(), 429);
        QCOMPARE(f.code, QStringLiteral("Throttling"));
        QCOMPARE(f.message, QStringLiteral("slow down"));
        QCOMPARE(f.errorType(), QStringLiteral("rate_limit_error"));
    }

    void testMapFailureUnparseable() {
        BailianOutbound outbound(UpstreamConfig{});
        DomainFailure f = outbound.mapFailure(502, "<html>Bad Gateway</html>");

        QCOMPARE(f.httpStatus(), 502);
        QCOMPARE(f.code, QStringLiteral("api_error"));
        QCOMPARE(f.message, QStringLiteral("API请求失败"));
        QCOMPARE(f.errorType(), QStringLiteral("server_error"));
    }
    void testTransportErrors() {
        DomainFailure timeout = QtExecutor::classifyTransportError(QNetworkReply::TimeoutError, {});
        QCOMPARE(timeout.httpStatus(), 504);
        QCOMPARE(timeout.errorType(), QStringLiteral("timeout_error"));
        QCOMPARE(timeout.message, QStringLiteral("请求超时，请稍后重试"));

        DomainFailure refused = QtExecutor::classifyTransportError(
            QNetworkReply::ConnectionRefusedError, QStringLiteral("Connection refused"));
        QCOMPARE(refused.httpStatus(), 500);
        QCOMPARE(refused.errorType(), QStringLiteral("server_error"));
        QCOMPARE(refused.message, QStringLiteral("无法连接到阿里云百炼API: Connection refused"));
    }
};

QTEST_MAIN(TestErrorTranslation)
#include "tst_error_translation.moc"
