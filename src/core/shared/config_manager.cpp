#include "core/shared/config_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <cmath>

namespace ge {

namespace {

bool rejectConfig(EngineError* error, const QString& message)
{
    LOG_WARN(geCore, "Rejected engine config: %s", qUtf8Printable(message));
    setError(error, EngineErrorCode::InvalidThreshold, message);
    return false;
}

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble(fallback) : fallback;
}

} // namespace

std::optional<EngineConfig> ConfigManager::load(EngineError* error)
{
    return loadFromFile(configFilePath(), error);
}

std::optional<EngineConfig> ConfigManager::loadFromFile(const QString& filePath, EngineError* error)
{
    QFile file(filePath);
    if (!file.exists()) {
        LOG_INFO(geCore, "No config at %s, using defaults", qUtf8Printable(filePath));
        EngineConfig defaults;
        if (!validate(defaults, error)) {
            return std::nullopt;
        }
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(geCore, "Failed to open config file for read: %s", qUtf8Printable(filePath));
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Cannot read config file: %1").arg(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(geCore, "Failed to parse config JSON (%s): %s",
                 qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Malformed config file: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    EngineConfig config = fromJson(doc.object());
    if (!validate(config, error)) {
        return std::nullopt;
    }
    return config;
}

bool ConfigManager::save(const EngineConfig& config, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(geCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(geCore, "Failed to open config file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(QJsonDocument(toJson(config)).toJson(QJsonDocument::Indented));
    file.close();
    if (bytesWritten < 0) {
        LOG_ERROR(geCore, "Failed to write config file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString ConfigManager::configFilePath()
{
    const QString overridePath = qEnvironmentVariable("GROWTHENGINE_CONFIG").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/growthengine/config.json");
}

QJsonObject ConfigManager::toJson(const EngineConfig& config)
{
    QJsonObject weights;
    for (const auto& [platform, weight] : config.scoring.platformWeights) {
        weights.insert(platformToString(platform), weight);
    }

    QJsonObject scoring;
    scoring.insert(QStringLiteral("platformWeights"), weights);
    scoring.insert(QStringLiteral("halfLifeHours"), config.scoring.halfLifeHours);
    scoring.insert(QStringLiteral("pageviewWeight"), config.scoring.pageviewWeight);
    scoring.insert(QStringLiteral("proMultiplier"), config.scoring.proMultiplier);

    QJsonObject featuring;
    featuring.insert(QStringLiteral("shareThreshold"), config.featuring.shareThreshold);
    featuring.insert(QStringLiteral("freeDurationHours"), config.featuring.freeDurationHours);
    featuring.insert(QStringLiteral("proDurationHours"), config.featuring.proDurationHours);

    QJsonObject milestone;
    milestone.insert(QStringLiteral("milestoneType"), config.milestone.milestoneType);
    milestone.insert(QStringLiteral("referralThreshold"), config.milestone.referralThreshold);
    milestone.insert(QStringLiteral("rewardMonths"), config.milestone.rewardMonths);

    QJsonArray schedule;
    for (const CommissionBreakpoint& bp : config.commission.schedule) {
        QJsonObject entry;
        entry.insert(QStringLiteral("tier"), bp.tierName);
        entry.insert(QStringLiteral("minAgeYears"), bp.minAgeYears);
        entry.insert(QStringLiteral("rateBps"), bp.rateBps);
        schedule.append(entry);
    }
    QJsonObject commission;
    commission.insert(QStringLiteral("schedule"), schedule);

    QJsonObject ingest;
    ingest.insert(QStringLiteral("maxAttempts"), config.ingest.maxAttempts);
    ingest.insert(QStringLiteral("backoffStepMs"), config.ingest.backoffStepMs);

    QJsonObject ranker;
    ranker.insert(QStringLiteral("intervalHours"), config.ranker.intervalHours);
    ranker.insert(QStringLiteral("runOnStart"), config.ranker.runOnStart);

    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), config.dbPath);
    json.insert(QStringLiteral("scoring"), scoring);
    json.insert(QStringLiteral("featuring"), featuring);
    json.insert(QStringLiteral("milestone"), milestone);
    json.insert(QStringLiteral("commission"), commission);
    json.insert(QStringLiteral("ingest"), ingest);
    json.insert(QStringLiteral("ranker"), ranker);
    return json;
}

EngineConfig ConfigManager::fromJson(const QJsonObject& json)
{
    EngineConfig config;
    config.dbPath = json.value(QStringLiteral("dbPath")).toString(config.dbPath);

    const QJsonObject scoring = json.value(QStringLiteral("scoring")).toObject();
    const QJsonObject weights = scoring.value(QStringLiteral("platformWeights")).toObject();
    for (auto it = weights.constBegin(); it != weights.constEnd(); ++it) {
        const std::optional<Platform> platform = platformFromString(it.key());
        if (!platform.has_value()) {
            LOG_WARN(geCore, "Ignoring weight for unknown platform '%s'", qUtf8Printable(it.key()));
            continue;
        }
        // Non-numeric weights become NaN so validate() rejects them.
        config.scoring.platformWeights[*platform] =
            it.value().isDouble() ? it.value().toDouble() : std::nan("");
    }
    config.scoring.halfLifeHours = readDouble(scoring, "halfLifeHours", config.scoring.halfLifeHours);
    config.scoring.pageviewWeight = readDouble(scoring, "pageviewWeight", config.scoring.pageviewWeight);
    config.scoring.proMultiplier = readDouble(scoring, "proMultiplier", config.scoring.proMultiplier);

    const QJsonObject featuring = json.value(QStringLiteral("featuring")).toObject();
    config.featuring.shareThreshold = readInt(featuring, "shareThreshold", config.featuring.shareThreshold);
    config.featuring.freeDurationHours =
        readInt(featuring, "freeDurationHours", config.featuring.freeDurationHours);
    config.featuring.proDurationHours =
        readInt(featuring, "proDurationHours", config.featuring.proDurationHours);

    const QJsonObject milestone = json.value(QStringLiteral("milestone")).toObject();
    config.milestone.milestoneType =
        milestone.value(QStringLiteral("milestoneType")).toString(config.milestone.milestoneType);
    config.milestone.referralThreshold =
        readInt(milestone, "referralThreshold", config.milestone.referralThreshold);
    config.milestone.rewardMonths = readInt(milestone, "rewardMonths", config.milestone.rewardMonths);

    const QJsonObject commission = json.value(QStringLiteral("commission")).toObject();
    if (commission.contains(QStringLiteral("schedule"))) {
        const QJsonArray schedule = commission.value(QStringLiteral("schedule")).toArray();
        config.commission.schedule.clear();
        config.commission.schedule.reserve(static_cast<size_t>(schedule.size()));
        for (const QJsonValue& value : schedule) {
            const QJsonObject entry = value.toObject();
            CommissionBreakpoint bp;
            bp.tierName = entry.value(QStringLiteral("tier")).toString();
            bp.minAgeYears = readDouble(entry, "minAgeYears", -1.0);
            bp.rateBps = readInt(entry, "rateBps", -1);
            config.commission.schedule.push_back(bp);
        }
    }

    const QJsonObject ingest = json.value(QStringLiteral("ingest")).toObject();
    config.ingest.maxAttempts = readInt(ingest, "maxAttempts", config.ingest.maxAttempts);
    config.ingest.backoffStepMs = readInt(ingest, "backoffStepMs", config.ingest.backoffStepMs);

    const QJsonObject ranker = json.value(QStringLiteral("ranker")).toObject();
    config.ranker.intervalHours = readInt(ranker, "intervalHours", config.ranker.intervalHours);
    config.ranker.runOnStart = ranker.value(QStringLiteral("runOnStart")).toBool(config.ranker.runOnStart);

    return config;
}

bool ConfigManager::validate(const EngineConfig& config, EngineError* error)
{
    const ScoringConfig& scoring = config.scoring;
    for (Platform platform : allPlatforms()) {
        const auto it = scoring.platformWeights.find(platform);
        if (it == scoring.platformWeights.end()) {
            return rejectConfig(error, QStringLiteral("Missing weight for platform %1")
                                           .arg(platformToString(platform)));
        }
        if (!std::isfinite(it->second) || it->second < 0.0) {
            return rejectConfig(error, QStringLiteral("Weight for platform %1 must be a non-negative number")
                                           .arg(platformToString(platform)));
        }
    }
    if (!std::isfinite(scoring.halfLifeHours) || scoring.halfLifeHours <= 0.0) {
        return rejectConfig(error, QStringLiteral("halfLifeHours must be positive"));
    }
    if (!std::isfinite(scoring.pageviewWeight) || scoring.pageviewWeight < 0.0) {
        return rejectConfig(error, QStringLiteral("pageviewWeight must be non-negative"));
    }
    if (!std::isfinite(scoring.proMultiplier) || scoring.proMultiplier < 1.0) {
        return rejectConfig(error, QStringLiteral("proMultiplier must be at least 1.0"));
    }

    if (config.featuring.shareThreshold <= 0) {
        return rejectConfig(error, QStringLiteral("shareThreshold must be positive"));
    }
    if (config.featuring.freeDurationHours <= 0 || config.featuring.proDurationHours <= 0) {
        return rejectConfig(error, QStringLiteral("Featuring durations must be positive"));
    }

    if (config.milestone.milestoneType.trimmed().isEmpty()) {
        return rejectConfig(error, QStringLiteral("milestoneType must not be empty"));
    }
    if (config.milestone.referralThreshold < 1) {
        return rejectConfig(error, QStringLiteral("referralThreshold must be at least 1"));
    }
    if (config.milestone.rewardMonths < 1) {
        return rejectConfig(error, QStringLiteral("rewardMonths must be at least 1"));
    }

    const std::vector<CommissionBreakpoint>& schedule = config.commission.schedule;
    if (schedule.empty()) {
        return rejectConfig(error, QStringLiteral("Commission schedule is empty"));
    }
    if (schedule.front().minAgeYears != 0.0) {
        return rejectConfig(error, QStringLiteral("First commission breakpoint must start at age 0"));
    }
    for (size_t i = 0; i < schedule.size(); ++i) {
        const CommissionBreakpoint& bp = schedule[i];
        if (bp.tierName.trimmed().isEmpty()) {
            return rejectConfig(error, QStringLiteral("Commission breakpoint %1 has no tier name").arg(i));
        }
        if (bp.rateBps < 0 || bp.rateBps > 10000) {
            return rejectConfig(error, QStringLiteral("Commission rate for tier %1 is outside [0, 10000] bps")
                                           .arg(bp.tierName));
        }
        if (i == 0) {
            continue;
        }
        const CommissionBreakpoint& prev = schedule[i - 1];
        if (!std::isfinite(bp.minAgeYears) || bp.minAgeYears <= prev.minAgeYears) {
            return rejectConfig(error, QStringLiteral("Commission breakpoints must be strictly increasing in age (tier %1)")
                                           .arg(bp.tierName));
        }
        if (bp.rateBps < prev.rateBps) {
            return rejectConfig(error, QStringLiteral("Commission rate decreases from tier %1 to tier %2")
                                           .arg(prev.tierName, bp.tierName));
        }
    }

    if (config.ingest.maxAttempts < 1 || config.ingest.backoffStepMs < 0) {
        return rejectConfig(error, QStringLiteral("Ingest retry policy is invalid"));
    }
    if (config.ranker.intervalHours < 1) {
        return rejectConfig(error, QStringLiteral("Ranker interval must be at least one hour"));
    }

    return true;
}

} // namespace ge
