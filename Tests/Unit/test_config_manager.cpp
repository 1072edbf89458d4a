#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "core/shared/config_manager.h"

#include <cmath>

namespace {

bool writeJson(const QString& path, const QByteArray& content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

} // namespace

class TestConfigManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsAreValid();
    void testMissingFileYieldsDefaults();
    void testSaveThenLoadKeepsOverrides();
    void testPartialFileKeepsDefaults();
    void testMalformedFileIsRejected();
    void testConfigPathFromEnvironment();

    void testRejectsNonPositiveThreshold();
    void testRejectsNonPositiveDuration();
    void testRejectsNegativeWeight();
    void testRejectsNonNumericWeight();
    void testRejectsNonPositiveHalfLife();
    void testRejectsMultiplierBelowOne();
    void testRejectsMilestoneThresholdBelowOne();
    void testRejectsEmptySchedule();
    void testRejectsScheduleNotStartingAtZero();
    void testRejectsNonIncreasingAges();
    void testRejectsDecreasingRates();
    void testRejectsRateOutOfRange();
};

void TestConfigManager::testDefaultsAreValid()
{
    ge::EngineConfig config;
    ge::EngineError error;
    QVERIFY2(ge::ConfigManager::validate(config, &error), qPrintable(error.message));

    QCOMPARE(config.featuring.shareThreshold, 5);
    QCOMPARE(config.featuring.freeDurationHours, 48);
    QCOMPARE(config.featuring.proDurationHours, 168);
    QCOMPARE(config.milestone.referralThreshold, 10);
    QCOMPARE(config.milestone.rewardMonths, 12);
    QCOMPARE(config.scoring.platformWeights.at(ge::Platform::HackerNews), 8.0);
    QCOMPARE(config.scoring.platformWeights.at(ge::Platform::Other), 2.0);
    QCOMPARE(config.scoring.halfLifeHours, 240.0);
    QCOMPARE(static_cast<int>(config.commission.schedule.size()), 3);
    QCOMPARE(config.commission.schedule.back().rateBps, 4000);
}

void TestConfigManager::testMissingFileYieldsDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const auto config = ge::ConfigManager::loadFromFile(dir.path() + "/absent.json");
    QVERIFY(config.has_value());
    QCOMPARE(config->featuring.shareThreshold, 5);
}

void TestConfigManager::testSaveThenLoadKeepsOverrides()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/nested/config.json";

    ge::EngineConfig config;
    config.dbPath = dir.path() + "/ledger.db";
    config.featuring.shareThreshold = 7;
    config.scoring.platformWeights[ge::Platform::Reddit] = 9.5;
    config.commission.schedule = {
        {QStringLiteral("starter"), 0.0, 1000},
        {QStringLiteral("loyal"), 2.0, 3000},
    };
    config.ranker.runOnStart = false;
    QVERIFY(ge::ConfigManager::save(config, path));

    ge::EngineError error;
    const auto loaded = ge::ConfigManager::loadFromFile(path, &error);
    QVERIFY2(loaded.has_value(), qPrintable(error.message));
    QCOMPARE(loaded->dbPath, config.dbPath);
    QCOMPARE(loaded->featuring.shareThreshold, 7);
    QCOMPARE(loaded->scoring.platformWeights.at(ge::Platform::Reddit), 9.5);
    QCOMPARE(static_cast<int>(loaded->commission.schedule.size()), 2);
    QCOMPARE(loaded->commission.schedule[1].tierName, QStringLiteral("loyal"));
    QCOMPARE(loaded->commission.schedule[1].rateBps, 3000);
    QCOMPARE(loaded->ranker.runOnStart, false);
}

void TestConfigManager::testPartialFileKeepsDefaults()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/config.json";
    QVERIFY(writeJson(path, R"({"featuring": {"proDurationHours": 72}, "unknownKey": true})"));

    const auto loaded = ge::ConfigManager::loadFromFile(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->featuring.proDurationHours, 72);
    QCOMPARE(loaded->featuring.freeDurationHours, 48);
    QCOMPARE(loaded->milestone.milestoneType, QStringLiteral("10-referrals-free-pro"));
}

void TestConfigManager::testMalformedFileIsRejected()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/config.json";
    QVERIFY(writeJson(path, "{ not json"));

    ge::EngineError error;
    QVERIFY(!ge::ConfigManager::loadFromFile(path, &error).has_value());
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidArgument);
}

void TestConfigManager::testConfigPathFromEnvironment()
{
    const QByteArray previous = qgetenv("GROWTHENGINE_CONFIG");
    qputenv("GROWTHENGINE_CONFIG", "/etc/growthengine/./config.json");
    QCOMPARE(ge::ConfigManager::configFilePath(), QStringLiteral("/etc/growthengine/config.json"));
    if (previous.isEmpty()) {
        qunsetenv("GROWTHENGINE_CONFIG");
    } else {
        qputenv("GROWTHENGINE_CONFIG", previous);
    }
}

void TestConfigManager::testRejectsNonPositiveThreshold()
{
    ge::EngineConfig config;
    config.featuring.shareThreshold = 0;
    ge::EngineError error;
    QVERIFY(!ge::ConfigManager::validate(config, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidThreshold);
}

void TestConfigManager::testRejectsNonPositiveDuration()
{
    ge::EngineConfig config;
    config.featuring.proDurationHours = 0;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsNegativeWeight()
{
    ge::EngineConfig config;
    config.scoring.platformWeights[ge::Platform::Slack] = -1.0;
    ge::EngineError error;
    QVERIFY(!ge::ConfigManager::validate(config, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidThreshold);
    QVERIFY(error.message.contains(QStringLiteral("slack")));
}

void TestConfigManager::testRejectsNonNumericWeight()
{
    QJsonObject weights;
    weights[QStringLiteral("twitter")] = QStringLiteral("lots");
    QJsonObject scoring;
    scoring[QStringLiteral("platformWeights")] = weights;
    QJsonObject json;
    json[QStringLiteral("scoring")] = scoring;

    const ge::EngineConfig config = ge::ConfigManager::fromJson(json);
    QVERIFY(std::isnan(config.scoring.platformWeights.at(ge::Platform::Twitter)));
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsNonPositiveHalfLife()
{
    ge::EngineConfig config;
    config.scoring.halfLifeHours = 0.0;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsMultiplierBelowOne()
{
    ge::EngineConfig config;
    config.scoring.proMultiplier = 0.9;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsMilestoneThresholdBelowOne()
{
    ge::EngineConfig config;
    config.milestone.referralThreshold = 0;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsEmptySchedule()
{
    ge::EngineConfig config;
    config.commission.schedule.clear();
    ge::EngineError error;
    QVERIFY(!ge::ConfigManager::validate(config, &error));
    QCOMPARE(error.code, ge::EngineErrorCode::InvalidThreshold);
}

void TestConfigManager::testRejectsScheduleNotStartingAtZero()
{
    ge::EngineConfig config;
    config.commission.schedule.front().minAgeYears = 0.5;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsNonIncreasingAges()
{
    ge::EngineConfig config;
    config.commission.schedule[2].minAgeYears = 1.0;
    QVERIFY(!ge::ConfigManager::validate(config));
}

void TestConfigManager::testRejectsDecreasingRates()
{
    ge::EngineConfig config;
    config.commission.schedule[2].rateBps = 1500;
    ge::EngineError error;
    QVERIFY(!ge::ConfigManager::validate(config, &error));
    QVERIFY(error.message.contains(QStringLiteral("legacy")));
}

void TestConfigManager::testRejectsRateOutOfRange()
{
    ge::EngineConfig config;
    config.commission.schedule[2].rateBps = 10001;
    QVERIFY(!ge::ConfigManager::validate(config));
}

QTEST_MAIN(TestConfigManager)
#include "test_config_manager.moc"
