#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/showcase/showcase_ranker.h"

#include <memory>

namespace {

constexpr qint64 kNow = 1704067200;
constexpr qint64 kHour = 3600;

ge::LedgerStore::ShowcaseCandidate candidate(const QString& siteId, qint64 createdAt,
                                             int freshTwitterShares, int64_t ownerShares = 0)
{
    ge::LedgerStore::ShowcaseCandidate c;
    c.site.id = siteId;
    c.site.ownerId = QStringLiteral("owner-") + siteId;
    c.site.tier = ge::Tier::Pro;
    c.site.createdAt = createdAt;
    c.site.showcaseEligible = true;
    for (int i = 0; i < freshTwitterShares; ++i) {
        ge::ShareEvent event;
        event.siteId = siteId;
        event.platform = ge::Platform::Twitter;
        event.idempotencyKey = QStringLiteral("%1-%2").arg(siteId).arg(i);
        event.occurredAt = kNow;
        c.events.push_back(event);
    }
    c.ownerTotalShares = ownerShares;
    return c;
}

} // namespace

class TestShowcaseRanker : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRankOrdersByScore();
    void testTiesBreakByCreatedAtThenId();
    void testBoostLevelFromOwnerShares();
    void testRunOnlyRanksEligibleLiveSites();
    void testRunReplacesPreviousGeneration();
    void testRunWithNoCandidates();

private:
    void addShares(const QString& siteId, int count, qint64 occurredAt);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<ge::LedgerStore> m_store;
    int m_keySeq = 0;
};

void TestShowcaseRanker::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = ge::LedgerStore::open(m_dir->path() + "/ledger.db");
    QVERIFY(m_store.has_value());
}

void TestShowcaseRanker::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestShowcaseRanker::addShares(const QString& siteId, int count, qint64 occurredAt)
{
    for (int i = 0; i < count; ++i) {
        ge::ShareEvent event;
        event.siteId = siteId;
        event.platform = ge::Platform::Reddit;
        event.idempotencyKey = QStringLiteral("k-%1").arg(++m_keySeq);
        event.occurredAt = occurredAt;
        QVERIFY(m_store->appendShareEvent(event, occurredAt).has_value());
    }
}

void TestShowcaseRanker::testRankOrdersByScore()
{
    ge::ShowcaseRanker ranker(*m_store);
    const std::vector<ge::LedgerStore::ShowcaseCandidate> candidates = {
        candidate("low", kNow, 1),
        candidate("high", kNow, 10),
        candidate("mid", kNow, 4),
    };

    const auto entries = ranker.rank(candidates, kNow);
    QCOMPARE(static_cast<int>(entries.size()), 3);
    QCOMPARE(entries[0].siteId, QStringLiteral("high"));
    QCOMPARE(entries[1].siteId, QStringLiteral("mid"));
    QCOMPARE(entries[2].siteId, QStringLiteral("low"));
    for (size_t i = 0; i < entries.size(); ++i) {
        QCOMPARE(entries[i].rank, static_cast<int>(i) + 1);
        if (i > 0) {
            QVERIFY(entries[i - 1].score >= entries[i].score);
        }
    }
    QCOMPARE(entries[0].ownerId, QStringLiteral("owner-high"));
}

void TestShowcaseRanker::testTiesBreakByCreatedAtThenId()
{
    ge::ShowcaseRanker ranker(*m_store);
    const std::vector<ge::LedgerStore::ShowcaseCandidate> candidates = {
        candidate("b-newer", kNow - kHour, 2),
        candidate("z-older", kNow - 10 * kHour, 2),
        candidate("a-newer", kNow - kHour, 2),
    };

    const auto entries = ranker.rank(candidates, kNow);
    QCOMPARE(entries[0].siteId, QStringLiteral("z-older"));
    QCOMPARE(entries[1].siteId, QStringLiteral("a-newer"));
    QCOMPARE(entries[2].siteId, QStringLiteral("b-newer"));
}

void TestShowcaseRanker::testBoostLevelFromOwnerShares()
{
    ge::ShowcaseRanker ranker(*m_store);
    const std::vector<ge::LedgerStore::ShowcaseCandidate> candidates = {
        candidate("none", kNow, 0, 0),
        candidate("silver", kNow, 1, 12),
        candidate("viral", kNow, 2, 500),
    };

    const auto entries = ranker.rank(candidates, kNow);
    QCOMPARE(entries[0].siteId, QStringLiteral("viral"));
    QCOMPARE(entries[0].boostLevel, ge::ViralBoostLevel::Viral);
    QCOMPARE(entries[1].boostLevel, ge::ViralBoostLevel::Silver);
    QCOMPARE(entries[2].boostLevel, ge::ViralBoostLevel::None);
}

void TestShowcaseRanker::testRunOnlyRanksEligibleLiveSites()
{
    QVERIFY(m_store->registerSite("pro-a", "pro-owner", ge::Tier::Pro, kNow - 48 * kHour));
    QVERIFY(m_store->registerSite("pro-b", "pro-owner", ge::Tier::Pro, kNow - 24 * kHour));
    QVERIFY(m_store->registerSite("pro-retired", "pro-owner", ge::Tier::Pro, kNow - 72 * kHour));
    QVERIFY(m_store->registerSite("free-site", "free-owner", ge::Tier::Free, kNow - 96 * kHour));

    addShares("pro-a", 2, kNow - kHour);
    addShares("pro-b", 6, kNow - kHour);
    addShares("pro-retired", 20, kNow - kHour);
    addShares("free-site", 30, kNow - kHour);
    QVERIFY(m_store->retireSite("pro-retired", kNow));

    ge::ShowcaseRanker ranker(*m_store);
    ge::EngineError error;
    auto result = ranker.run(kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->entryCount, 2);
    QCOMPARE(result->generatedAt, kNow);
    QVERIFY(!result->generationId.isEmpty());

    const auto page = m_store->showcasePage(10, 0);
    QCOMPARE(static_cast<int>(page.size()), 2);
    QCOMPARE(page[0].siteId, QStringLiteral("pro-b"));
    QCOMPARE(page[1].siteId, QStringLiteral("pro-a"));
    QCOMPARE(page[0].generationId, result->generationId);

    // Owner boost counts shares across all of the owner's sites, retired included.
    QCOMPARE(page[0].boostLevel, ge::ViralBoostLevel::Gold);
}

void TestShowcaseRanker::testRunReplacesPreviousGeneration()
{
    QVERIFY(m_store->registerSite("pro-a", "pro-owner", ge::Tier::Pro, kNow));
    addShares("pro-a", 1, kNow);

    ge::ShowcaseRanker ranker(*m_store);
    auto first = ranker.run(kNow);
    QVERIFY(first.has_value());

    QVERIFY(m_store->registerSite("pro-b", "pro-owner", ge::Tier::Pro, kNow));
    addShares("pro-b", 3, kNow);
    auto second = ranker.run(kNow + kHour);
    QVERIFY(second.has_value());
    QVERIFY(second->generationId != first->generationId);

    QCOMPARE(m_store->showcaseSize(), 2);
    for (const auto& entry : m_store->showcasePage(10, 0)) {
        QCOMPARE(entry.generationId, second->generationId);
    }
    QCOMPARE(*m_store->getSetting(QStringLiteral("showcaseGeneration")), second->generationId);
}

void TestShowcaseRanker::testRunWithNoCandidates()
{
    QVERIFY(m_store->registerSite("free-site", "free-owner", ge::Tier::Free, kNow));

    ge::ShowcaseRanker ranker(*m_store);
    auto result = ranker.run(kNow);
    QVERIFY(result.has_value());
    QCOMPARE(result->entryCount, 0);
    QCOMPARE(m_store->showcaseSize(), 0);
}

QTEST_MAIN(TestShowcaseRanker)
#include "test_showcase_ranker.moc"
