#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/engine/growth_engine.h"

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace {

constexpr qint64 kNow = 1718409600;
constexpr int kThreads = 4;
constexpr int kUniquePerThread = 25;
constexpr int kSharedKeys = 10;

ge::EngineConfig configFor(const QString& dbPath)
{
    ge::EngineConfig config;
    config.dbPath = dbPath;
    config.ingest.maxAttempts = 8;
    config.ingest.backoffStepMs = 5;
    return config;
}

} // namespace

class TestConcurrentIngestion : public QObject {
    Q_OBJECT

private slots:
    void testSharesLandExactlyOnce();
    void testConcurrentPageviewsAreAdditive();
};

void TestConcurrentIngestion::testSharesLandExactlyOnce()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const ge::EngineConfig config = configFor(dir.path() + "/ledger.db");
    const ge::Clock clock = [] { return kNow; };

    {
        auto setup = ge::GrowthEngine::open(config, clock);
        QVERIFY(setup);
        QVERIFY(setup->registerSite("hot-site", "owner", ge::Tier::Free, kNow - 3600).has_value());
    }

    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            // One engine per thread, all on the same ledger file.
            auto engine = ge::GrowthEngine::open(config, clock);
            if (!engine) {
                ++failures;
                return;
            }
            const ge::Platform platform = t % 2 == 0 ? ge::Platform::Twitter : ge::Platform::Reddit;
            for (int i = 0; i < kUniquePerThread + kSharedKeys; ++i) {
                // Every thread resends the same shared keys.
                const QString key = i < kUniquePerThread
                    ? QStringLiteral("t%1-%2").arg(t).arg(i)
                    : QStringLiteral("shared-%1").arg(i - kUniquePerThread);
                ge::EngineError error;
                const auto result = engine->recordShare("hot-site", platform, key, kNow, &error);
                if (!result.has_value()) {
                    ++failures;
                } else if (result->accepted) {
                    ++accepted;
                } else {
                    ++duplicates;
                }
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    const int expectedTotal = kThreads * kUniquePerThread + kSharedKeys;
    QCOMPARE(failures.load(), 0);
    QCOMPARE(accepted.load(), expectedTotal);
    QCOMPARE(duplicates.load(), (kThreads - 1) * kSharedKeys);

    auto reader = ge::GrowthEngine::open(config, clock);
    QVERIFY(reader);
    const auto site = reader->getSite("hot-site");
    QVERIFY(site.has_value());
    QCOMPARE(site->totalShares, expectedTotal);

    int platformSum = 0;
    for (const auto& [platform, count] : site->platformShares) {
        Q_UNUSED(platform);
        platformSum += count;
    }
    QCOMPARE(platformSum, expectedTotal);
    QCOMPARE(static_cast<int>(reader->store().shareEventsForSite("hot-site").size()), expectedTotal);

    // The share that reached the final multiple always wins the swap.
    QCOMPARE(site->lastTriggeredMultiple, expectedTotal - expectedTotal % 5);

    // Every multiple reached fired exactly once, whatever the interleaving.
    const auto history = reader->featuringHistory("hot-site");
    std::multiset<int> multiples;
    for (const ge::FeaturingEvent& event : history) {
        multiples.insert(event.shareMultiple);
    }
    const int lastMultiple = expectedTotal - expectedTotal % 5;
    QCOMPARE(static_cast<int>(history.size()), lastMultiple / 5);
    for (int multiple = 5; multiple <= lastMultiple; multiple += 5) {
        QCOMPARE(static_cast<int>(multiples.count(multiple)), 1);
    }
    QCOMPARE(*site->autoFeaturedUntil, kNow + 48 * 3600);

    // Nothing is left over for the sweep to recover.
    const auto report = reader->reconcile();
    QVERIFY(report.has_value());
    QCOMPARE(report->featuringFired, 0);
}

void TestConcurrentIngestion::testConcurrentPageviewsAreAdditive()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const ge::EngineConfig config = configFor(dir.path() + "/ledger.db");
    const ge::Clock clock = [] { return kNow; };

    {
        auto setup = ge::GrowthEngine::open(config, clock);
        QVERIFY(setup);
        QVERIFY(setup->registerSite("site", "owner", ge::Tier::Pro, kNow).has_value());
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&]() {
            auto engine = ge::GrowthEngine::open(config, clock);
            if (!engine) {
                ++failures;
                return;
            }
            for (int i = 0; i < 50; ++i) {
                if (!engine->recordPageview("site", 2)) {
                    ++failures;
                }
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    QCOMPARE(failures.load(), 0);
    auto reader = ge::GrowthEngine::open(config, clock);
    QVERIFY(reader);
    QCOMPARE(reader->getSite("site")->pageviews, int64_t{kThreads * 50 * 2});
}

QTEST_MAIN(TestConcurrentIngestion)
#include "test_concurrent_ingestion.moc"
