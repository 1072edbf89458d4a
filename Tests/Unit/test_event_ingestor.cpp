#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>
#include "core/ingest/event_ingestor.h"

#include <memory>
#include <stdexcept>

namespace {

constexpr qint64 kNow = 1704067200;

ge::Clock fixedClock()
{
    return [] { return kNow; };
}

} // namespace

class TestEventIngestor : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testShareAcceptedAndPublished();
    void testDuplicateShareNotPublished();
    void testShareValidation();
    void testShareUnknownSiteIsNotRetried();
    void testBusyStoreIsRetriedThenReported();
    void testShareCrossingFeaturesWithTheWrite();
    void testReferralConversion();
    void testPendingReferralConversion();
    void testReferralValidation();
    void testPageviews();
    void testThrowingHandlerDoesNotLoseWrite();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<ge::LedgerStore> m_store;
};

void TestEventIngestor::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = ge::LedgerStore::open(m_dir->path() + "/ledger.db");
    QVERIFY(m_store.has_value());
    QVERIFY(m_store->registerSite("site-a", "owner-a", ge::Tier::Free, kNow).has_value());
}

void TestEventIngestor::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestEventIngestor::testShareAcceptedAndPublished()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());
    std::vector<ge::GrowthNotification> seen;
    ingestor.subscribe([&seen](const ge::GrowthNotification& n) { seen.push_back(n); });

    auto first = ingestor.recordShare("site-a", ge::Platform::Reddit, "key-1", kNow - 60);
    QVERIFY(first.has_value());
    QVERIFY(first->accepted);
    QCOMPARE(first->newShareCount, 1);

    auto second = ingestor.recordShare("site-a", ge::Platform::Twitter, "key-2", kNow - 30);
    QVERIFY(second.has_value());
    QCOMPARE(second->newShareCount, 2);

    QCOMPARE(static_cast<int>(seen.size()), 2);
    QCOMPARE(seen[0].kind, ge::NotificationKind::ShareRecorded);
    QCOMPARE(seen[0].siteId, QStringLiteral("site-a"));
    QCOMPARE(seen[0].platform, ge::Platform::Reddit);
    QCOMPARE(seen[0].totalShares, 1);
    QCOMPARE(seen[0].occurredAt, kNow - 60);
    QCOMPARE(seen[0].publishedAt, kNow);
    QCOMPARE(seen[1].totalShares, 2);
}

void TestEventIngestor::testDuplicateShareNotPublished()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());
    int published = 0;
    ingestor.subscribe([&published](const ge::GrowthNotification&) { ++published; });

    QVERIFY(ingestor.recordShare("site-a", ge::Platform::Email, "key-1", kNow)->accepted);
    auto dup = ingestor.recordShare("site-a", ge::Platform::Email, "key-1", kNow);
    QVERIFY(dup.has_value());
    QVERIFY(!dup->accepted);
    QCOMPARE(dup->newShareCount, 1);
    QCOMPARE(published, 1);
    QCOMPARE(m_store->getSite("site-a")->totalShares, 1);
}

void TestEventIngestor::testShareValidation()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());

    ge::EngineError error;
    QVERIFY(!ingestor.recordShare("site-a", ge::Platform::Email, "  ", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);

    error = {};
    QVERIFY(!ingestor.recordShare("", ge::Platform::Email, "key", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);
}

void TestEventIngestor::testShareUnknownSiteIsNotRetried()
{
    ge::IngestConfig config;
    config.maxAttempts = 5;
    config.backoffStepMs = 1000;
    ge::EventIngestor ingestor(*m_store, config, fixedClock());

    QElapsedTimer timer;
    timer.start();
    ge::EngineError error;
    QVERIFY(!ingestor.recordShare("ghost", ge::Platform::Email, "key", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::NotFound);
    QVERIFY(timer.elapsed() < 1000);
}

void TestEventIngestor::testBusyStoreIsRetriedThenReported()
{
    // Fail fast on the lock instead of waiting out the busy timeout.
    QCOMPARE(sqlite3_exec(m_store->rawDb(), "PRAGMA busy_timeout = 0", nullptr, nullptr, nullptr),
             SQLITE_OK);

    sqlite3* blocker = nullptr;
    QCOMPARE(sqlite3_open(QString(m_dir->path() + "/ledger.db").toUtf8().constData(), &blocker),
             SQLITE_OK);
    QCOMPARE(sqlite3_exec(blocker, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), SQLITE_OK);

    ge::IngestConfig config;
    config.maxAttempts = 3;
    config.backoffStepMs = 1;
    ge::EventIngestor ingestor(*m_store, config, fixedClock());
    int published = 0;
    ingestor.subscribe([&published](const ge::GrowthNotification&) { ++published; });

    ge::EngineError error;
    QVERIFY(!ingestor.recordShare("site-a", ge::Platform::Slack, "retry-key", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::TransientStoreError);
    QVERIFY(ge::isRetryable(error.code));
    QCOMPARE(published, 0);

    QCOMPARE(sqlite3_exec(blocker, "ROLLBACK", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(blocker);

    // Resending with the same key lands exactly once.
    auto resent = ingestor.recordShare("site-a", ge::Platform::Slack, "retry-key", kNow);
    QVERIFY(resent.has_value());
    QVERIFY(resent->accepted);
    QCOMPARE(resent->newShareCount, 1);
    auto again = ingestor.recordShare("site-a", ge::Platform::Slack, "retry-key", kNow);
    QVERIFY(!again->accepted);
    QCOMPARE(published, 1);
}

void TestEventIngestor::testShareCrossingFeaturesWithTheWrite()
{
    ge::FeaturingConfig featuring;
    featuring.shareThreshold = 3;
    featuring.freeDurationHours = 24;
    ge::EventIngestor ingestor(*m_store, {}, fixedClock(), featuring);

    // No subscriber: featuring does not depend on notification delivery.
    for (int i = 1; i <= 7; ++i) {
        auto result = ingestor.recordShare("site-a", ge::Platform::Reddit,
                                           QStringLiteral("key-%1").arg(i), kNow);
        QVERIFY(result.has_value());
        QCOMPARE(result->featuringFired, i % 3 == 0);
        if (result->featuringFired) {
            QCOMPARE(*result->featuredUntil, kNow + 24 * 3600);
        }
    }

    const auto site = m_store->getSite("site-a");
    QCOMPARE(site->lastTriggeredMultiple, 6);
    QVERIFY(site->isFeatured(kNow));
    QCOMPARE(static_cast<int>(m_store->featuringEventsForSite("site-a").size()), 2);
}

void TestEventIngestor::testReferralConversion()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());
    std::vector<ge::GrowthNotification> seen;
    ingestor.subscribe([&seen](const ge::GrowthNotification& n) { seen.push_back(n); });

    auto edge = ingestor.recordReferralConversion("alice", "bob", kNow - 3600);
    QVERIFY(edge.has_value());
    QCOMPARE(edge->status, ge::ReferralStatus::Active);
    QCOMPARE(edge->convertedAt, kNow - 3600);

    QCOMPARE(static_cast<int>(seen.size()), 1);
    QCOMPARE(seen[0].kind, ge::NotificationKind::ReferralConverted);
    QCOMPARE(seen[0].edgeId, edge->id);
    QCOMPARE(seen[0].referrerId, QStringLiteral("alice"));
    QCOMPARE(seen[0].refereeId, QStringLiteral("bob"));

    ge::EngineError error;
    QVERIFY(!ingestor.recordReferralConversion("alice", "bob", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::DuplicateConversion);
    QCOMPARE(static_cast<int>(seen.size()), 1);
}

void TestEventIngestor::testPendingReferralConversion()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());

    auto edge = ingestor.recordReferralConversion("alice", "bob", kNow, ge::ReferralStatus::Pending);
    QVERIFY(edge.has_value());
    QCOMPARE(edge->status, ge::ReferralStatus::Pending);
    QCOMPARE(m_store->countActiveReferrals("alice").value_or(-1), 0);

    ge::EngineError error;
    QVERIFY(!ingestor.recordReferralConversion("alice", "bob", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::DuplicateConversion);

    error = {};
    QVERIFY(!ingestor.recordReferralConversion("alice", "carol", kNow,
                                               ge::ReferralStatus::Churned, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);
}

void TestEventIngestor::testReferralValidation()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());

    ge::EngineError error;
    QVERIFY(!ingestor.recordReferralConversion("alice", "alice", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);

    error = {};
    QVERIFY(!ingestor.recordReferralConversion("", "bob", kNow, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);
}

void TestEventIngestor::testPageviews()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());
    QVERIFY(ingestor.recordPageview("site-a", 3));
    QVERIFY(ingestor.recordPageview("site-a", 4));
    QCOMPARE(m_store->getSite("site-a")->pageviews, int64_t{7});

    ge::EngineError error;
    QVERIFY(!ingestor.recordPageview("site-a", 0, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);

    error = {};
    QVERIFY(!ingestor.recordPageview("ghost", 1, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::NotFound);
}

void TestEventIngestor::testThrowingHandlerDoesNotLoseWrite()
{
    ge::EventIngestor ingestor(*m_store, {}, fixedClock());
    int laterHandlerCalls = 0;
    ingestor.subscribe([](const ge::GrowthNotification&) {
        throw std::runtime_error("subscriber down");
    });
    ingestor.subscribe([&laterHandlerCalls](const ge::GrowthNotification&) { ++laterHandlerCalls; });

    auto result = ingestor.recordShare("site-a", ge::Platform::Discord, "key-1", kNow);
    QVERIFY(result.has_value());
    QVERIFY(result->accepted);
    QCOMPARE(laterHandlerCalls, 1);
    QCOMPARE(m_store->getSite("site-a")->totalShares, 1);
}

QTEST_MAIN(TestEventIngestor)
#include "test_event_ingestor.moc"
