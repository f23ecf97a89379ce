#include <QtTest/QtTest>
#include <QSignalSpy>
#include "acquisition/AcquisitionPipeline.h"
#include "FakeNetworkLayer.h"

using TaskState = AcquisitionPipeline::TaskState;
using FailureKind = AcquisitionPipeline::FailureKind;

static QString thumbUrl(int i)
{
    return QStringLiteral("https://media.example/api/thumb/%1?w=400").arg(i);
}

// Fast timings so retry loops finish within a QTRY window
static AcquisitionConfig fastConfig()
{
    AcquisitionConfig c;
    c.processingDelayMs = 5;
    c.rateLimitBaseDelayMs = 1;
    c.jitterMs = 0;
    c.maxBackoffMs = 40;
    return c;
}

static TaskState lastStateFor(const QSignalSpy& spy, NodeRef node)
{
    TaskState state = TaskState::Queued;
    for (const QList<QVariant>& args : spy) {
        if (args.at(0).value<NodeRef>() == node)
            state = args.at(1).value<TaskState>();
    }
    return state;
}

class tst_AcquisitionPipeline : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        qRegisterMetaType<NodeRef>("NodeRef");
        qRegisterMetaType<AcquisitionPipeline::TaskState>();
        qRegisterMetaType<AcquisitionPipeline::FailureKind>();
    }

    // ── Concurrency and order ────────────────────────────────────
    void concurrencyCeiling_isNeverExceeded()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());

        int maxActive = 0;
        connect(&pipeline, &AcquisitionPipeline::taskStateChanged, this, [&]() {
            maxActive = qMax(maxActive, pipeline.activeCount());
        });

        for (int i = 1; i <= 20; ++i)
            pipeline.enqueueVisible(i, thumbUrl(i));

        QCOMPARE(pipeline.activeCount(), 6);
        QCOMPARE(net.pending.size(), 6);
        QCOMPARE(pipeline.queuedCount(), 14);

        // Each completion frees exactly one slot for the next task
        while (!net.pending.isEmpty()) {
            QVERIFY(net.respond(FakeNetworkLayer::ok()));
            QVERIFY(pipeline.activeCount() <= 6);
        }
        QCOMPARE(net.requestCount(), 20);
        QCOMPARE(pipeline.activeCount(), 0);
        QCOMPARE(maxActive, 6);
    }

    void dispatch_isFifo()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 2;
        AcquisitionPipeline pipeline(&net, &reg, config);

        for (int i = 1; i <= 6; ++i)
            pipeline.enqueueVisible(i, thumbUrl(i));
        while (!net.pending.isEmpty())
            net.respond(FakeNetworkLayer::ok());

        QCOMPARE(net.requested.size(), 6);
        for (int i = 0; i < 6; ++i)
            QCOMPARE(net.requested[i], QUrl(thumbUrl(i + 1)));
    }

    void duplicateEnqueue_isIgnored()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        pipeline.enqueueVisible(1, thumbUrl(1));
        pipeline.enqueueVisible(1, thumbUrl(1));
        QCOMPARE(net.requestCount(), 1);
    }

    // ── Success ──────────────────────────────────────────────────
    void ok_emitsReadyWithDecodedImage()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy states(&pipeline, &AcquisitionPipeline::taskStateChanged);

        pipeline.enqueueVisible(7, thumbUrl(7));
        QVERIFY(net.respond(FakeNetworkLayer::ok(8, 5)));

        QCOMPARE(ready.count(), 1);
        QCOMPARE(ready.at(0).at(0).value<NodeRef>(), NodeRef(7));
        QCOMPARE(ready.at(0).at(1).value<QImage>().size(), QSize(8, 5));
        QCOMPARE(lastStateFor(states, 7), TaskState::Succeeded);
        QVERIFY(!pipeline.hasTask(7));
    }

    void cacheHit_skipsNetwork()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::ok());
        pipeline.enqueueVisible(2, thumbUrl(1));

        QCOMPARE(net.requestCount(), 1);
        QCOMPARE(ready.count(), 2);
        QCOMPARE(ready.at(1).at(0).value<NodeRef>(), NodeRef(2));
    }

    // ── Processing (202) ─────────────────────────────────────────
    void processing_pollsUntilReady()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy processing(&pipeline, &AcquisitionPipeline::thumbnailProcessing);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(202, FakeNetworkLayer::pngBytes(2, 2)));
        QCOMPARE(processing.count(), 1);
        QCOMPARE(pipeline.waitingCount(), 1);
        QCOMPARE(pipeline.activeCount(), 0);

        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::status(202));
        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::ok());

        QCOMPARE(ready.count(), 1);
        QCOMPARE(net.requestCount(), 3);
    }

    void endlessProcessing_failsAfterRetryBudget()
    {
        FakeNetworkLayer net;
        net.autoReply = [](const QUrl&) { return FakeNetworkLayer::status(202); };
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));

        QTRY_COMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(1).value<FailureKind>(), FailureKind::Exhausted);
        QCOMPARE(net.requestCount(), 10);

        // Terminal: no further requests
        QTest::qWait(30);
        QCOMPARE(net.requestCount(), 10);
        QVERIFY(!pipeline.hasTask(1));
    }

    // ── Rate limiting (429) ──────────────────────────────────────
    void rateLimited_retriesThenSucceeds()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(429));
        QCOMPARE(pipeline.waitingCount(), 1);

        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(ready.count(), 1);
        QCOMPARE(failed.count(), 0);
        QCOMPARE(net.requestCount(), 2);
    }

    void rateLimited_consumesAttempts()
    {
        FakeNetworkLayer net;
        net.autoReply = [](const QUrl&) { return FakeNetworkLayer::status(429); };
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.retryBudget = 3;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));

        QTRY_COMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(1).value<FailureKind>(), FailureKind::Exhausted);
        QCOMPARE(net.requestCount(), 3);
    }

    void rateLimited_honoursRetryAfter()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.rateLimitBaseDelayMs = 20000;   // computed backoff would be far too slow
        config.maxBackoffMs = 60000;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(429, {}, {{"Retry-After", "0"}}));

        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(ready.count(), 1);
    }

    void rateLimited_afterZeroRetryAfter_backsOffFromBase()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.rateLimitBaseDelayMs = 200;
        config.maxBackoffMs = 1000;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(429, {}, {{"Retry-After", "0"}}));
        QTRY_COMPARE(net.pending.size(), 1);

        // No hint this time: doubles the base, not the zero hint
        net.respond(FakeNetworkLayer::status(429));
        QCOMPARE(pipeline.waitingCount(), 1);
        QTest::qWait(150);
        QCOMPARE(net.pending.size(), 0);
        QCOMPARE(pipeline.waitingCount(), 1);

        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(ready.count(), 1);
        QCOMPARE(net.requestCount(), 3);
    }

    void retriedTask_respectsConcurrency()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 1;
        AcquisitionPipeline pipeline(&net, &reg, config);

        pipeline.enqueueVisible(1, thumbUrl(1));
        pipeline.enqueueVisible(2, thumbUrl(2));
        net.respond(FakeNetworkLayer::status(429));

        // Node 2 took the free slot; node 1's retry must wait for it
        QCOMPARE(net.pending.size(), 1);
        QCOMPARE(net.pending.first().url, QUrl(thumbUrl(2)));
        QTest::qWait(30);
        QCOMPARE(net.pending.size(), 1);
        QCOMPARE(pipeline.activeCount(), 1);

        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(net.pending.size(), 1);
        QCOMPARE(net.pending.first().url, QUrl(thumbUrl(1)));
    }

    // ── Server errors ────────────────────────────────────────────
    void generationFailed_isInvalidWithoutRetry()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(500, {}, {{"X-Thumb-Status", "failed"}}));

        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(1).value<FailureKind>(), FailureKind::Invalid);
        QTest::qWait(30);
        QCOMPARE(net.requestCount(), 1);
    }

    void serverError_isRetried()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(503));
        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::networkError());
        QTRY_COMPARE(net.pending.size(), 1);
        net.respond(FakeNetworkLayer::ok());

        QCOMPARE(ready.count(), 1);
        QCOMPARE(net.requestCount(), 3);
    }

    void unexpectedStatus_isInvalid()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(404));
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(1).value<FailureKind>(), FailureKind::Invalid);
    }

    void undecodableBody_isInvalid()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(200, "not an image"));
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(1).value<FailureKind>(), FailureKind::Invalid);
    }

    // ── URL validation ───────────────────────────────────────────
    void invalidUrl_failsWithoutRequest()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, QStringLiteral("https://media.example/api/thumb/undefined"));
        pipeline.enqueueVisible(2, QStringLiteral("https://media.example/api/thumb?id=null"));
        pipeline.enqueueVisible(3, QString());

        QCOMPARE(net.requestCount(), 0);
        QCOMPARE(failed.count(), 3);
        for (const auto& args : failed)
            QCOMPARE(args.at(1).value<FailureKind>(), FailureKind::Invalid);
    }

    void isValidResourceUrl_cases()
    {
        QVERIFY(AcquisitionPipeline::isValidResourceUrl(thumbUrl(1)));
        QVERIFY(AcquisitionPipeline::isValidResourceUrl(QStringLiteral("http://host/a/nullable.jpg")));
        QVERIFY(!AcquisitionPipeline::isValidResourceUrl(QStringLiteral("/relative/path")));
        QVERIFY(!AcquisitionPipeline::isValidResourceUrl(QStringLiteral("http://host/null/x")));
        QVERIFY(!AcquisitionPipeline::isValidResourceUrl(QStringLiteral("   ")));
    }

    // ── Cancellation ─────────────────────────────────────────────
    void groupAbort_cancelsSilently()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 2;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy states(&pipeline, &AcquisitionPipeline::taskStateChanged);

        for (int i = 1; i <= 5; ++i)
            pipeline.enqueueVisible(i, thumbUrl(i));
        QCOMPARE(pipeline.activeCount(), 2);

        reg.abort(QStringLiteral("thumb"));

        // Queued tasks settle at once, active ones when their reply aborts
        QCOMPARE(lastStateFor(states, 5), TaskState::Cancelled);
        QTRY_COMPARE(pipeline.activeCount(), 0);
        QCOMPARE(lastStateFor(states, 1), TaskState::Cancelled);
        QCOMPARE(net.requestCount(), 2);
        QCOMPARE(failed.count(), 0);
        QCOMPARE(ready.count(), 0);

        // A fresh generation of work is unaffected
        pipeline.enqueueVisible(9, thumbUrl(9));
        QCOMPARE(pipeline.activeCount(), 1);
        net.respond(FakeNetworkLayer::ok(), QUrl(thumbUrl(9)));
        QCOMPARE(ready.count(), 1);
    }

    void groupAbort_cancelsWaitingTask()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.processingDelayMs = 10000;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy states(&pipeline, &AcquisitionPipeline::taskStateChanged);

        pipeline.enqueueVisible(1, thumbUrl(1));
        net.respond(FakeNetworkLayer::status(202));
        QCOMPARE(pipeline.waitingCount(), 1);

        reg.abort(QStringLiteral("thumb"));
        QCOMPARE(pipeline.waitingCount(), 0);
        QCOMPARE(lastStateFor(states, 1), TaskState::Cancelled);
        QVERIFY(!pipeline.hasTask(1));
    }

    void otherGroups_doNotAffectThumbnails()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        reg.next(QStringLiteral("search"));
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);

        pipeline.enqueueVisible(1, thumbUrl(1));
        reg.next(QStringLiteral("search"));
        reg.abortMany({QStringLiteral("page"), QStringLiteral("search"), QStringLiteral("modal")});

        QCOMPARE(pipeline.activeCount(), 1);
        QTest::qWait(10);
        QVERIFY(net.respond(FakeNetworkLayer::ok()));
        QCOMPARE(ready.count(), 1);
    }

    void cancelNode_queuedTaskNeverRequested()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 1;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy states(&pipeline, &AcquisitionPipeline::taskStateChanged);

        pipeline.enqueueVisible(1, thumbUrl(1));
        pipeline.enqueueVisible(2, thumbUrl(2));
        pipeline.cancelNode(2);
        QCOMPARE(lastStateFor(states, 2), TaskState::Cancelled);

        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(net.requestCount(), 1);
        QCOMPARE(pipeline.activeCount(), 0);
    }

    void cancelNode_activeTaskHoldsSlotUntilReply()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 1;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy states(&pipeline, &AcquisitionPipeline::taskStateChanged);

        pipeline.enqueueVisible(1, thumbUrl(1));
        pipeline.enqueueVisible(2, thumbUrl(2));
        pipeline.cancelNode(1);

        QCOMPARE(pipeline.activeCount(), 1);
        QCOMPARE(net.pending.size(), 1);

        net.respond(FakeNetworkLayer::ok(), QUrl(thumbUrl(1)));
        QCOMPARE(ready.count(), 0);
        QCOMPARE(lastStateFor(states, 1), TaskState::Cancelled);
        // Slot handed on to node 2
        QCOMPARE(net.pending.size(), 1);
        QCOMPARE(net.pending.first().url, QUrl(thumbUrl(2)));
    }

    void clear_cancelsEverything()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionConfig config = fastConfig();
        config.concurrency = 1;
        AcquisitionPipeline pipeline(&net, &reg, config);
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        for (int i = 1; i <= 4; ++i)
            pipeline.enqueueVisible(i, thumbUrl(i));
        pipeline.clear();
        QCOMPARE(pipeline.queuedCount(), 0);

        net.respond(FakeNetworkLayer::ok());
        QCOMPARE(pipeline.activeCount(), 0);
        QCOMPARE(net.requestCount(), 1);
        QCOMPARE(failed.count(), 0);
    }

    // ── Attachment ───────────────────────────────────────────────
    void detachedNode_isNeverRequested()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSet<NodeRef> attached{1, 3};
        pipeline.setAttachmentCheck([&](NodeRef n) { return attached.contains(n); });

        for (int i = 1; i <= 3; ++i)
            pipeline.enqueueVisible(i, thumbUrl(i));

        QCOMPARE(net.requestCount(), 2);
        QVERIFY(!net.requested.contains(QUrl(thumbUrl(2))));
        QVERIFY(!pipeline.hasTask(2));
    }

    void detachedDuringFlight_producesNoResult()
    {
        FakeNetworkLayer net;
        CancellationRegistry reg;
        AcquisitionPipeline pipeline(&net, &reg, fastConfig());
        QSet<NodeRef> attached{1};
        pipeline.setAttachmentCheck([&](NodeRef n) { return attached.contains(n); });
        QSignalSpy ready(&pipeline, &AcquisitionPipeline::thumbnailReady);
        QSignalSpy failed(&pipeline, &AcquisitionPipeline::thumbnailFailed);

        pipeline.enqueueVisible(1, thumbUrl(1));
        attached.clear();
        net.respond(FakeNetworkLayer::status(404));

        QCOMPARE(ready.count(), 0);
        QCOMPARE(failed.count(), 0);
        QCOMPARE(pipeline.activeCount(), 0);
    }
};

QTEST_MAIN(tst_AcquisitionPipeline)
#include "tst_AcquisitionPipeline.moc"
