#include <QTest>
#include <QSignalSpy>
#include "adapters/outbound/bailian.h"
#include "semantic/stream_session.h"
#include "fake_reply.h"

class TestStreamSession : public QObject {
    Q_OBJECT

private:
    static StreamSession* makeSession(FakeReply* reply, bool translate) {
        std::unique_ptr<StreamTranslator> translator;
        if (translate)
            translator = std::make_unique<StreamTranslator>(QStringLiteral("qwen-plus"), 1);
        return new StreamSession(reply, &BailianOutbound::parseFrame,
                                 std::move(translator), QDeadlineTimer(QDeadlineTimer::Forever));
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<StandardChunk>("StandardChunk");
        qRegisterMetaType<StreamEnd>("StreamEnd");
        qRegisterMetaType<DomainFailure>("DomainFailure");
    }

    void testTranslatedStream() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, true));

        QList<StandardChunk> chunks;
        connect(session.get(), &StreamSession::chunkReady, this,
                [&chunks](const StandardChunk& c) { chunks.append(c); });
        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);
        session->start();

        reply->push("id:1\nevent:result\ndata:{\"output\":{\"text\":\"Hi\",\"finish_reason\":\"null\"},\"request_id\":\"r1\"}\n\n");
        reply->push("data:{\"output\":{\"text\":\"Hi there\",\"finish_reason\":\"null\"},\"request_id\":\"r1\"}\n\n");
        reply->push("data:{\"output\":{\"text\":\"Hi there!\",\"finish_reason\":\"stop\"},"
                    "\"usage\":{\"models\":[{\"input_tokens\":3,\"output_tokens\":1}]},\"request_id\":\"r1\"}\n\n");

        QCOMPARE(chunks.size(), 4);
        QCOMPARE(*chunks[0].deltaContent, QStringLiteral("Hi"));
        QCOMPARE(*chunks[1].deltaContent, QStringLiteral(" there"));
        QCOMPARE(*chunks[2].deltaContent, QStringLiteral("!"));
        QCOMPARE(*chunks[3].finishReason, QStringLiteral("stop"));
        QCOMPARE(chunks[3].usage->totalTokens, 4);

        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).value<StreamEnd>(), StreamEnd::Completed);
        QVERIFY(reply->abortCount > 0);
    }

    void testMalformedFrameSkipped() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, true));

        QList<StandardChunk> chunks;
        connect(session.get(), &StreamSession::chunkReady, this,
                [&chunks](const StandardChunk& c) { chunks.append(c); });
        QSignalSpy errorSpy(session.get(), &StreamSession::error);

        reply->push("data:{\"output\":{\"text\":\"A\"}}\n\n");
        reply->push("data:{\"output\": broken\n\n");
        reply->push("data: keep-alive\n\n");
        reply->push("data:{\"output\":{\"text\":\"AB\"}}\n\n");

        QCOMPARE(chunks.size(), 2);
        QCOMPARE(*chunks[1].deltaContent, QStringLiteral("B"));
        QCOMPARE(errorSpy.count(), 0);
    }

    void testTruncatedStream() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, true));

        QSignalSpy chunkSpy(session.get(), &StreamSession::chunkReady);
        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);

        reply->push("data:{\"output\":{\"text\":\"partial\"}}\n\n");
        reply->complete();

        QCOMPARE(chunkSpy.count(), 1);
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).value<StreamEnd>(), StreamEnd::Truncated);
    }

    void testTerminalFrameWithoutTrailingBlankLine() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, true));

        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);

        reply->push("data:{\"output\":{\"text\":\"ok\",\"finish_reason\":\"stop\"}}");
        QCOMPARE(finishedSpy.count(), 0);
        reply->complete();

        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).value<StreamEnd>(), StreamEnd::Completed);
    }

    void testPassthroughRelaysBytes() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, false));
        QVERIFY(session->isPassthrough());

        QByteArray relayed;
        connect(session.get(), &StreamSession::rawDataReady, this,
                [&relayed](const QByteArray& d) { relayed.append(d); });
        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);

        reply->push("data: {\"choices\":[]}\n\n");
        reply->push("data: [DONE]\n\n");
        reply->complete();

        QCOMPARE(relayed, QByteArray("data: {\"choices\":[]}\n\ndata: [DONE]\n\n"));
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).value<StreamEnd>(), StreamEnd::Completed);
    }

    void testNetworkErrorMapsToFailure() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(makeSession(reply, true));

        QSignalSpy errorSpy(session.get(), &StreamSession::error);
        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);

        reply->failWith(QNetworkReply::RemoteHostClosedError);

        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).value<DomainFailure>().kind, ErrorKind::Unavailable);
        QCOMPARE(finishedSpy.count(), 0);
    }

    void testDeadlineAbortsStream() {
        auto* reply = new FakeReply;
        std::unique_ptr<StreamSession> session(new StreamSession(
            reply, &BailianOutbound::parseFrame,
            std::make_unique<StreamTranslator>(QStringLiteral("m"), 1),
            QDeadlineTimer(50)));

        QSignalSpy errorSpy(session.get(), &StreamSession::error);
        session->start();

        QVERIFY(errorSpy.wait(2000));
        QCOMPARE(errorSpy.at(0).at(0).value<DomainFailure>().kind, ErrorKind::Timeout);
        QVERIFY(reply->abortCount > 0);
    }

    void testStartPicksUpBufferedData() {
        auto* reply = new FakeReply;
        reply->push("data:{\"output\":{\"text\":\"early\",\"finish_reason\":\"stop\"}}\n\n");

        std::unique_ptr<StreamSession> session(makeSession(reply, true));
        QSignalSpy chunkSpy(session.get(), &StreamSession::chunkReady);
        QSignalSpy finishedSpy(session.get(), &StreamSession::finished);

        session->start();
        QVERIFY(finishedSpy.wait(2000));
        QCOMPARE(chunkSpy.count(), 2);
    }
};

QTEST_MAIN(TestStreamSession)
#include "tst_stream_session.moc"
