#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/ipc/message.h"
#include "core/ipc/socket_client.h"
#include "ipc_test_utils.h"
#include "services/growth/growth_service.h"

#include <QJsonArray>
#include <QMutex>
#include <QMutexLocker>

#include <atomic>
#include <cmath>
#include <memory>
#include <thread>

namespace {

constexpr qint64 kNow = 1718409600;            // 2024-06-15T00:00:00Z
constexpr qint64 kJanFirst2024 = 1704067200;   // 2024-01-01T00:00:00Z

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

} // namespace

class TestGrowthServiceRequests : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testPingAndUnknownMethod();
    void testSiteLifecycle();
    void testRecordShareFeaturesSite();
    void testReferralsAndMilestoneStatus();
    void testSetUserTier();
    void testCommissionFlow();
    void testShowcaseJobAndPaging();
    void testReconcile();
    void testSocketRoundTripWithNotifications();

private:
    QJsonObject call(const QString& method, const QJsonObject& params = {});

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<ge::GrowthService> m_service;
    qint64 m_now = kNow;
    uint64_t m_nextId = 1;
};

void TestGrowthServiceRequests::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_now = kNow;

    ge::EngineConfig config;
    config.dbPath = m_dir->path() + "/ledger.db";
    config.ranker.runOnStart = false;
    m_service = std::make_unique<ge::GrowthService>(config, [this] { return m_now; });

    ge::EngineError error;
    QVERIFY2(m_service->initialize(&error), qPrintable(error.message));
}

void TestGrowthServiceRequests::cleanup()
{
    m_service.reset();
    m_dir.reset();
}

QJsonObject TestGrowthServiceRequests::call(const QString& method, const QJsonObject& params)
{
    return m_service->handleRequest(ge::IpcMessage::makeRequest(m_nextId++, method, params));
}

void TestGrowthServiceRequests::testPingAndUnknownMethod()
{
    const QJsonObject pong = call(QStringLiteral("ping"));
    QVERIFY(ge::test::isResponse(pong));
    QCOMPARE(ge::test::resultPayload(pong).value(QStringLiteral("service")).toString(),
             QStringLiteral("growth"));

    const QJsonObject unknown = call(QStringLiteral("getQueueStatus"));
    QVERIFY(ge::test::isError(unknown));
    QCOMPARE(ge::test::errorCode(unknown), static_cast<int>(ge::IpcErrorCode::Unsupported));
}

void TestGrowthServiceRequests::testSiteLifecycle()
{
    QJsonObject params{{"siteId", "site-1"}, {"ownerId", "alice"}, {"ownerTier", "pro"}};
    QJsonObject response = call(QStringLiteral("registerSite"), params);
    QVERIFY(ge::test::isResponse(response));
    QJsonObject result = ge::test::resultPayload(response);
    QVERIFY(result.value(QStringLiteral("created")).toBool());
    QCOMPARE(result.value(QStringLiteral("tier")).toString(), QStringLiteral("pro"));
    QVERIFY(result.value(QStringLiteral("showcaseEligible")).toBool());
    QCOMPARE(result.value(QStringLiteral("createdAt")).toInteger(), kNow);

    response = call(QStringLiteral("registerSite"), params);
    QVERIFY(ge::test::isResponse(response));
    QVERIFY(!ge::test::resultPayload(response).value(QStringLiteral("created")).toBool(true));

    // Same site, different owner.
    response = call(QStringLiteral("registerSite"),
                    {{"siteId", "site-1"}, {"ownerId", "mallory"}});
    QVERIFY(ge::test::isError(response));

    response = call(QStringLiteral("registerSite"), {{"siteId", "site-2"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("registerSite"),
                    {{"siteId", "site-2"}, {"ownerId", "bob"}, {"ownerTier", "gold"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));

    response = call(QStringLiteral("getSite"), {{"siteId", "site-1"}});
    QVERIFY(ge::test::isResponse(response));
    result = ge::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("ownerId")).toString(), QStringLiteral("alice"));
    QVERIFY(result.value(QStringLiteral("retiredAt")).isNull());
    QVERIFY(result.value(QStringLiteral("featuringHistory")).toArray().isEmpty());

    response = call(QStringLiteral("getSite"), {{"siteId", "ghost"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));

    response = call(QStringLiteral("retireSite"), {{"siteId", "site-1"}});
    QVERIFY(ge::test::isResponse(response));
    QVERIFY(ge::test::resultPayload(response).value(QStringLiteral("retired")).toBool());

    // Retired sites no longer take shares.
    response = call(QStringLiteral("recordShare"),
                    {{"siteId", "site-1"}, {"platform", "twitter"}, {"idempotencyKey", "k"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));
}

void TestGrowthServiceRequests::testRecordShareFeaturesSite()
{
    QVERIFY(ge::test::isResponse(
        call(QStringLiteral("registerSite"), {{"siteId", "site"}, {"ownerId", "alice"}})));

    for (int i = 1; i <= 5; ++i) {
        const QJsonObject response = call(QStringLiteral("recordShare"),
            {{"siteId", "site"}, {"platform", "hackernews"},
             {"idempotencyKey", QStringLiteral("key-%1").arg(i)}, {"occurredAt", kNow - 60}});
        QVERIFY(ge::test::isResponse(response));
        const QJsonObject result = ge::test::resultPayload(response);
        QVERIFY(result.value(QStringLiteral("accepted")).toBool());
        QCOMPARE(result.value(QStringLiteral("newShareCount")).toInt(), i);
        QCOMPARE(result.value(QStringLiteral("featuringFired")).toBool(), i == 5);
    }

    QJsonObject response = call(QStringLiteral("recordShare"),
        {{"siteId", "site"}, {"platform", "hackernews"}, {"idempotencyKey", "key-5"}});
    QVERIFY(ge::test::isResponse(response));
    QVERIFY(!ge::test::resultPayload(response).value(QStringLiteral("accepted")).toBool(true));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("newShareCount")).toInt(), 5);

    response = call(QStringLiteral("recordShare"),
        {{"siteId", "site"}, {"platform", "myspace"}, {"idempotencyKey", "key-6"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("recordShare"), {{"siteId", "site"}, {"platform", "email"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));

    response = call(QStringLiteral("getSite"), {{"siteId", "site"}});
    const QJsonObject site = ge::test::resultPayload(response);
    QCOMPARE(site.value(QStringLiteral("totalShares")).toInt(), 5);
    QVERIFY(site.value(QStringLiteral("featured")).toBool());
    QCOMPARE(site.value(QStringLiteral("autoFeaturedUntil")).toInteger(), kNow + 48 * 3600);
    QCOMPARE(site.value(QStringLiteral("platformShares")).toObject()
                 .value(QStringLiteral("hackernews")).toInt(), 5);
    const QJsonArray history = site.value(QStringLiteral("featuringHistory")).toArray();
    QCOMPARE(history.size(), 1);
    QCOMPARE(history.at(0).toObject().value(QStringLiteral("shareMultiple")).toInt(), 5);

    QVERIFY(ge::test::isResponse(
        call(QStringLiteral("recordPageview"), {{"siteId", "site"}, {"count", 3}})));
    response = call(QStringLiteral("recordPageview"), {{"siteId", "site"}, {"count", 0}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));

    response = call(QStringLiteral("getScore"), {{"siteId", "site"}});
    QVERIFY(ge::test::isResponse(response));
    const QJsonObject score = ge::test::resultPayload(response);
    QVERIFY(score.value(QStringLiteral("score")).toDouble() > 40.0);
    QCOMPARE(score.value(QStringLiteral("tierMultiplier")).toDouble(), 1.0);
    QVERIFY(qAbs(score.value(QStringLiteral("pageviewTerm")).toDouble() - std::log1p(3.0)) < 1e-9);
}

void TestGrowthServiceRequests::testReferralsAndMilestoneStatus()
{
    QJsonObject response = call(QStringLiteral("recordReferralConversion"),
                                {{"referrerId", "alice"}, {"refereeId", "bob"}});
    QVERIFY(ge::test::isResponse(response));
    const QJsonObject edge = ge::test::resultPayload(response);
    QCOMPARE(edge.value(QStringLiteral("status")).toString(), QStringLiteral("active"));
    QCOMPARE(edge.value(QStringLiteral("convertedAt")).toInteger(), kNow);
    const qint64 edgeId = edge.value(QStringLiteral("edgeId")).toInteger();

    response = call(QStringLiteral("recordReferralConversion"),
                    {{"referrerId", "alice"}, {"refereeId", "bob"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::Conflict));
    response = call(QStringLiteral("recordReferralConversion"),
                    {{"referrerId", "alice"}, {"refereeId", "alice"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));

    response = call(QStringLiteral("getMilestoneStatus"), {{"userId", "alice"}});
    QVERIFY(ge::test::isResponse(response));
    QJsonObject status = ge::test::resultPayload(response);
    QCOMPARE(status.value(QStringLiteral("activeReferrals")).toInt(), 1);
    QCOMPARE(status.value(QStringLiteral("remaining")).toInt(), 9);
    QVERIFY(status.value(QStringLiteral("milestones")).toArray().isEmpty());

    response = call(QStringLiteral("updateReferralStatus"),
                    {{"edgeId", edgeId}, {"status", "churned"}});
    QVERIFY(ge::test::isResponse(response));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("status")).toString(),
             QStringLiteral("churned"));

    response = call(QStringLiteral("updateReferralStatus"),
                    {{"edgeId", edgeId}, {"status", "asleep"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("updateReferralStatus"),
                    {{"edgeId", 9999}, {"status", "active"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));

    status = ge::test::resultPayload(
        call(QStringLiteral("getMilestoneStatus"), {{"userId", "alice"}}));
    QCOMPARE(status.value(QStringLiteral("activeReferrals")).toInt(), 0);

    // A churned pair may convert again.
    response = call(QStringLiteral("recordReferralConversion"),
                    {{"referrerId", "alice"}, {"refereeId", "bob"}});
    QVERIFY(ge::test::isResponse(response));

    // Pending conversions count once activated.
    response = call(QStringLiteral("recordReferralConversion"),
                    {{"referrerId", "alice"}, {"refereeId", "carol"}, {"status", "pending"}});
    QVERIFY(ge::test::isResponse(response));
    const QJsonObject pending = ge::test::resultPayload(response);
    QCOMPARE(pending.value(QStringLiteral("status")).toString(), QStringLiteral("pending"));
    status = ge::test::resultPayload(
        call(QStringLiteral("getMilestoneStatus"), {{"userId", "alice"}}));
    QCOMPARE(status.value(QStringLiteral("activeReferrals")).toInt(), 1);

    response = call(QStringLiteral("updateReferralStatus"),
                    {{"edgeId", pending.value(QStringLiteral("edgeId")).toInteger()},
                     {"status", "active"}});
    QVERIFY(ge::test::isResponse(response));
    status = ge::test::resultPayload(
        call(QStringLiteral("getMilestoneStatus"), {{"userId", "alice"}}));
    QCOMPARE(status.value(QStringLiteral("activeReferrals")).toInt(), 2);

    response = call(QStringLiteral("recordReferralConversion"),
                    {{"referrerId", "alice"}, {"refereeId", "dave"}, {"status", "churned"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
}

void TestGrowthServiceRequests::testSetUserTier()
{
    QVERIFY(ge::test::isResponse(
        call(QStringLiteral("registerSite"), {{"siteId", "site"}, {"ownerId", "alice"}})));

    QJsonObject response = call(QStringLiteral("setUserTier"),
        {{"userId", "alice"}, {"tier", "pro"}, {"proExpiresAt", kNow - 1}, {"source", "stripe"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));

    response = call(QStringLiteral("setUserTier"),
        {{"userId", "alice"}, {"tier", "pro"}, {"proExpiresAt", kNow + 86400}, {"source", "stripe"}});
    QVERIFY(ge::test::isResponse(response));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("tier")).toString(),
             QStringLiteral("pro"));
    QVERIFY(ge::test::resultPayload(
        call(QStringLiteral("getSite"), {{"siteId", "site"}})).value(QStringLiteral("showcaseEligible")).toBool());

    response = call(QStringLiteral("setUserTier"), {{"userId", "alice"}, {"tier", "platinum"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("setUserTier"), {{"userId", "nobody"}, {"tier", "pro"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));
}

void TestGrowthServiceRequests::testCommissionFlow()
{
    QJsonObject response = call(QStringLiteral("recordReferralConversion"),
        {{"referrerId", "alice"}, {"refereeId", "bob"}, {"occurredAt", kJanFirst2024}});
    const qint64 edgeId = ge::test::resultPayload(response).value(QStringLiteral("edgeId")).toInteger();

    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", edgeId}, {"period", "2024-03"}, {"revenue", 10000}});
    QVERIFY(ge::test::isResponse(response));
    const QJsonObject march = ge::test::resultPayload(response);
    QCOMPARE(march.value(QStringLiteral("rateBps")).toInt(), 2000);
    QCOMPARE(march.value(QStringLiteral("payableAmount")).toInteger(), qint64(2000));
    QCOMPARE(march.value(QStringLiteral("kind")).toString(), QStringLiteral("settlement"));
    QCOMPARE(march.value(QStringLiteral("settlementStatus")).toString(), QStringLiteral("pending"));

    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", edgeId}, {"period", "2024-03"}, {"revenue", 10000}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::Conflict));
    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", edgeId}, {"period", "2024-04"}, {"revenue", 100.5}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", edgeId}, {"period", "2024-13"}, {"revenue", 100}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", 777}, {"period", "2024-04"}, {"revenue", 100}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));

    const qint64 marchEntry = march.value(QStringLiteral("entryId")).toInteger();
    response = call(QStringLiteral("reverseCommission"), {{"entryId", marchEntry}});
    QVERIFY(ge::test::isResponse(response));
    QVERIFY(ge::test::resultPayload(response).value(QStringLiteral("applied")).toBool());
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("reversesEntryId")).toInteger(),
             marchEntry);

    // Reversing twice is reported as already applied.
    response = call(QStringLiteral("reverseCommission"), {{"entryId", marchEntry}});
    QVERIFY(ge::test::isResponse(response));
    QVERIFY(!ge::test::resultPayload(response).value(QStringLiteral("applied")).toBool(true));

    response = call(QStringLiteral("settlePeriod"),
                    {{"edgeId", edgeId}, {"period", "2024-04"}, {"revenue", 5000}});
    QVERIFY(ge::test::isResponse(response));

    response = call(QStringLiteral("getCommissionSummary"), {{"userId", "alice"}});
    QVERIFY(ge::test::isResponse(response));
    QJsonObject summary = ge::test::resultPayload(response);
    QCOMPARE(summary.value(QStringLiteral("totalEarned")).toInteger(), qint64(1000));
    QCOMPARE(summary.value(QStringLiteral("pendingAmount")).toInteger(), qint64(1000));
    QCOMPARE(summary.value(QStringLiteral("pendingPeriod")).toString(), QStringLiteral("2024-04"));
    QCOMPARE(summary.value(QStringLiteral("currentRateBps")).toInt(), 2000);
    QCOMPARE(summary.value(QStringLiteral("tierName")).toString(), QStringLiteral("new"));
    QCOMPARE(summary.value(QStringLiteral("nextTierName")).toString(), QStringLiteral("established"));
    QCOMPARE(summary.value(QStringLiteral("activeReferrals")).toInt(), 1);

    response = call(QStringLiteral("claimCommissions"), {{"userId", "alice"}, {"period", "2024-04"}});
    QVERIFY(ge::test::isResponse(response));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("amount")).toInteger(), qint64(1000));
    QVERIFY(ge::test::resultPayload(response).value(QStringLiteral("claimed")).toBool());

    response = call(QStringLiteral("claimCommissions"), {{"userId", "alice"}, {"period", "2024-04"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::Conflict));
    response = call(QStringLiteral("claimCommissions"), {{"userId", "ghost"}, {"period", "2024-04"}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::NotFound));

    summary = ge::test::resultPayload(
        call(QStringLiteral("getCommissionSummary"), {{"userId", "alice"}}));
    QCOMPARE(summary.value(QStringLiteral("pendingAmount")).toInteger(), qint64(0));
    QCOMPARE(summary.value(QStringLiteral("lifetimePaid")).toInteger(), qint64(1000));
}

void TestGrowthServiceRequests::testShowcaseJobAndPaging()
{
    QVERIFY(ge::test::isResponse(call(QStringLiteral("registerSite"),
        {{"siteId", "a"}, {"ownerId", "alice"}, {"ownerTier", "pro"}})));
    QVERIFY(ge::test::isResponse(call(QStringLiteral("registerSite"),
        {{"siteId", "b"}, {"ownerId", "bob"}, {"ownerTier", "pro"}})));
    QVERIFY(ge::test::isResponse(call(QStringLiteral("registerSite"),
        {{"siteId", "c"}, {"ownerId", "carol"}})));
    for (int i = 0; i < 3; ++i) {
        QVERIFY(ge::test::isResponse(call(QStringLiteral("recordShare"),
            {{"siteId", "b"}, {"platform", "reddit"}, {"idempotencyKey", QStringLiteral("b-%1").arg(i)}})));
    }

    QJsonObject response = call(QStringLiteral("runShowcase"), {{"wait", true}});
    QVERIFY(ge::test::isResponse(response));
    QJsonObject job = ge::test::resultPayload(response);
    QVERIFY(job.value(QStringLiteral("started")).toBool());
    QVERIFY(!job.value(QStringLiteral("running")).toBool(true));
    const QJsonObject last = job.value(QStringLiteral("lastResult")).toObject();
    QVERIFY(last.value(QStringLiteral("ok")).toBool());
    QCOMPARE(last.value(QStringLiteral("run")).toObject().value(QStringLiteral("entryCount")).toInt(), 2);

    response = call(QStringLiteral("getShowcase"), {{"limit", 1}});
    QVERIFY(ge::test::isResponse(response));
    QJsonObject page = ge::test::resultPayload(response);
    QCOMPARE(page.value(QStringLiteral("total")).toInt(), 2);
    QJsonArray entries = page.value(QStringLiteral("entries")).toArray();
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries.at(0).toObject().value(QStringLiteral("siteId")).toString(), QStringLiteral("b"));
    QCOMPARE(entries.at(0).toObject().value(QStringLiteral("rank")).toInt(), 1);
    QVERIFY(!page.value(QStringLiteral("generationId")).toString().isEmpty());

    page = ge::test::resultPayload(call(QStringLiteral("getShowcase"), {{"limit", 10}, {"offset", 1}}));
    entries = page.value(QStringLiteral("entries")).toArray();
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries.at(0).toObject().value(QStringLiteral("siteId")).toString(), QStringLiteral("a"));

    response = call(QStringLiteral("getShowcase"), {{"limit", 0}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("getShowcase"), {{"limit", 501}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
    response = call(QStringLiteral("getShowcase"), {{"offset", -1}});
    QCOMPARE(ge::test::errorCode(response), static_cast<int>(ge::IpcErrorCode::InvalidParams));
}

void TestGrowthServiceRequests::testReconcile()
{
    QVERIFY(ge::test::isResponse(
        call(QStringLiteral("registerSite"), {{"siteId", "site"}, {"ownerId", "alice"}})));

    ge::ShareEvent event;
    event.siteId = QStringLiteral("site");
    event.platform = ge::Platform::Email;
    event.occurredAt = kNow;
    for (int i = 0; i < 5; ++i) {
        event.idempotencyKey = QStringLiteral("direct-%1").arg(i);
        QVERIFY(m_service->engine()->store().appendShareEvent(event, kNow).has_value());
    }

    QJsonObject response = call(QStringLiteral("reconcile"));
    QVERIFY(ge::test::isResponse(response));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("featuringFired")).toInt(), 1);

    response = call(QStringLiteral("reconcile"));
    QCOMPARE(ge::test::resultPayload(response).value(QStringLiteral("featuringFired")).toInt(), 0);
}

void TestGrowthServiceRequests::testSocketRoundTripWithNotifications()
{
    QTemporaryDir socketDir(QStringLiteral("/tmp/ge-svc-XXXXXX"));
    QVERIFY(socketDir.isValid());
    ScopedEnvVar socketEnv("GROWTHENGINE_SOCKET_DIR", socketDir.path().toUtf8());
    ScopedEnvVar pidEnv("GROWTHENGINE_PID_DIR", socketDir.path().toUtf8());

    QVERIFY(m_service->start());
    const QString socketPath = ge::ServiceBase::socketPath(QStringLiteral("growth"));

    struct ClientOutcome {
        QMutex mutex;
        bool connected = false;
        QJsonObject registerResponse;
        QJsonObject shareResponse;
        QStringList notifications;
    } outcome;
    std::atomic<bool> done{false};

    // The client blocks on its socket while this thread serves requests.
    std::thread clientThread([&]() {
        ge::SocketClient client;
        if (!client.connectToServer(socketPath, 3000)) {
            done = true;
            return;
        }
        client.setNotificationHandler([&outcome](const QString& method, const QJsonObject&) {
            QMutexLocker lock(&outcome.mutex);
            outcome.notifications.append(method);
        });

        const auto registered = client.sendRequest(
            QStringLiteral("registerSite"),
            {{"siteId", "socket-site"}, {"ownerId", "alice"}}, 3000);
        const auto shared = client.sendRequest(
            QStringLiteral("recordShare"),
            {{"siteId", "socket-site"}, {"platform", "slack"}, {"idempotencyKey", "sock-1"}}, 3000);
        client.pollNotifications(200);

        {
            QMutexLocker lock(&outcome.mutex);
            outcome.connected = true;
            outcome.registerResponse = registered.value_or(QJsonObject());
            outcome.shareResponse = shared.value_or(QJsonObject());
        }
        client.disconnect();
        done = true;
    });

    QTRY_VERIFY_WITH_TIMEOUT(done.load(), 10000);
    clientThread.join();
    m_service->stop();

    QMutexLocker lock(&outcome.mutex);
    QVERIFY(outcome.connected);
    QVERIFY(ge::test::isResponse(outcome.registerResponse));
    QVERIFY(ge::test::isResponse(outcome.shareResponse));
    QCOMPARE(ge::test::resultPayload(outcome.shareResponse).value(QStringLiteral("newShareCount")).toInt(), 1);
    QVERIFY(outcome.notifications.contains(QStringLiteral("shareRecorded")));
}

QTEST_MAIN(TestGrowthServiceRequests)
#include "test_growth_service_requests.moc"
