#include "growth_service.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonArray>
#include <QMutexLocker>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace ge {

namespace {

constexpr int kDefaultShowcasePage = 50;

QString requireString(const QJsonObject& params, const char* key)
{
    return params.value(QLatin1String(key)).toString().trimmed();
}

// Integral JSON number, or nullopt when missing or fractional.
std::optional<qint64> readInteger(const QJsonObject& params, const char* key)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw) || std::floor(raw) != raw) {
        return std::nullopt;
    }
    return value.toInteger();
}

QJsonValue optionalTime(const std::optional<qint64>& value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonObject invalidParams(uint64_t id, const QString& message)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, message);
}

QJsonObject engineErrorResponse(uint64_t id, const EngineError& error)
{
    switch (error.code) {
    case EngineErrorCode::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound, error.message);
    case EngineErrorCode::InvalidArgument:
    case EngineErrorCode::InvalidThreshold:
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error.message);
    case EngineErrorCode::TransientStoreError:
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable, error.message, true);
    case EngineErrorCode::DuplicateEvent:
    case EngineErrorCode::DuplicateConversion:
    case EngineErrorCode::DuplicatePeriod:
        return IpcMessage::makeError(id, IpcErrorCode::Conflict, error.message);
    case EngineErrorCode::InvariantViolation:
        break;
    }
    return IpcMessage::makeError(id, IpcErrorCode::InternalError, error.message);
}

QJsonObject siteToJson(const SiteRecord& site, qint64 now)
{
    QJsonObject platforms;
    for (const auto& [platform, count] : site.platformShares) {
        platforms[platformToString(platform)] = count;
    }

    QJsonObject json;
    json[QStringLiteral("siteId")] = site.id;
    json[QStringLiteral("ownerId")] = site.ownerId;
    json[QStringLiteral("tier")] = tierToString(site.tier);
    json[QStringLiteral("createdAt")] = site.createdAt;
    json[QStringLiteral("pageviews")] = static_cast<qint64>(site.pageviews);
    json[QStringLiteral("totalShares")] = site.totalShares;
    json[QStringLiteral("platformShares")] = platforms;
    json[QStringLiteral("lastTriggeredMultiple")] = site.lastTriggeredMultiple;
    json[QStringLiteral("autoFeaturedUntil")] = optionalTime(site.autoFeaturedUntil);
    json[QStringLiteral("featured")] = site.isFeatured(now);
    json[QStringLiteral("showcaseEligible")] = site.showcaseEligible;
    json[QStringLiteral("retiredAt")] = optionalTime(site.retiredAt);
    json[QStringLiteral("version")] = static_cast<qint64>(site.version);
    return json;
}

QJsonObject edgeToJson(const ReferralEdge& edge)
{
    QJsonObject json;
    json[QStringLiteral("edgeId")] = static_cast<qint64>(edge.id);
    json[QStringLiteral("referrerId")] = edge.referrerId;
    json[QStringLiteral("refereeId")] = edge.refereeId;
    json[QStringLiteral("convertedAt")] = edge.convertedAt;
    json[QStringLiteral("status")] = referralStatusToString(edge.status);
    return json;
}

QJsonObject entryToJson(const CommissionLedgerEntry& entry)
{
    QJsonObject json;
    json[QStringLiteral("entryId")] = static_cast<qint64>(entry.id);
    json[QStringLiteral("edgeId")] = static_cast<qint64>(entry.edgeId);
    json[QStringLiteral("period")] = entry.period;
    json[QStringLiteral("periodStart")] = entry.periodStart;
    json[QStringLiteral("periodEnd")] = entry.periodEnd;
    json[QStringLiteral("kind")] = entryKindToString(entry.kind);
    if (entry.kind == EntryKind::Reversal) {
        json[QStringLiteral("reversesEntryId")] = static_cast<qint64>(entry.reversesEntryId);
    }
    json[QStringLiteral("rateBps")] = entry.rateBps;
    json[QStringLiteral("baseAmount")] = static_cast<qint64>(entry.baseAmount);
    json[QStringLiteral("payableAmount")] = static_cast<qint64>(entry.payableAmount);
    json[QStringLiteral("settlementStatus")] = settlementStatusToString(entry.settlementStatus);
    json[QStringLiteral("createdAt")] = entry.createdAt;
    return json;
}

QJsonObject reconcileToJson(const TriggerDispatcher::ReconcileReport& report)
{
    QJsonObject json;
    json[QStringLiteral("tiersExpired")] = report.tiersExpired;
    json[QStringLiteral("featuringFired")] = report.featuringFired;
    json[QStringLiteral("milestonesGranted")] = report.milestonesGranted;
    json[QStringLiteral("failures")] = report.failures;
    return json;
}

QJsonObject runToJson(const ShowcaseRanker::RunResult& run)
{
    QJsonObject json;
    json[QStringLiteral("generationId")] = run.generationId;
    json[QStringLiteral("generatedAt")] = run.generatedAt;
    json[QStringLiteral("entryCount")] = run.entryCount;
    json[QStringLiteral("elapsedMs")] = run.elapsedMs;
    return json;
}

} // namespace

GrowthService::GrowthService(const EngineConfig& config, Clock clock, QObject* parent)
    : ServiceBase(QStringLiteral("growth"), parent)
    , m_config(config)
    , m_clock(clock ? std::move(clock) : systemClock())
    , m_showcaseTimer(new QTimer(this))
{
    connect(m_showcaseTimer, &QTimer::timeout, this, [this]() {
        if (!startShowcaseJob()) {
            LOG_INFO(geRanking, "Scheduled showcase run skipped, previous job still running");
        }
    });
}

GrowthService::~GrowthService()
{
    m_showcaseTimer->stop();
    joinJobThreadIfNeeded();
}

bool GrowthService::initialize(EngineError* error)
{
    m_engine = GrowthEngine::open(m_config, m_clock, error);
    if (!m_engine) {
        LOG_ERROR(geCore, "Growth engine failed to open %s", qPrintable(m_config.dbPath));
        return false;
    }

    m_engine->ingestor().subscribe([this](const GrowthNotification& notification) {
        broadcastNotification(notification);
    });

    m_showcaseTimer->setInterval(std::chrono::hours(m_config.ranker.intervalHours));
    m_showcaseTimer->start();
    if (m_config.ranker.runOnStart) {
        QTimer::singleShot(0, this, [this]() { startShowcaseJob(); });
    }

    LOG_INFO(geCore, "Growth service ready (ledger=%s, showcase every %dh)",
             qPrintable(m_config.dbPath), m_config.ranker.intervalHours);
    return true;
}

QJsonObject GrowthService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (method == QLatin1String("ping") || method == QLatin1String("shutdown")) {
        return ServiceBase::handleRequest(request);
    }
    if (!m_engine) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Growth engine is not initialized"), true);
    }

    if (method == QLatin1String("registerSite"))             return handleRegisterSite(id, params);
    if (method == QLatin1String("retireSite"))               return handleRetireSite(id, params);
    if (method == QLatin1String("setUserTier"))              return handleSetUserTier(id, params);
    if (method == QLatin1String("recordShare"))              return handleRecordShare(id, params);
    if (method == QLatin1String("recordPageview"))           return handleRecordPageview(id, params);
    if (method == QLatin1String("recordReferralConversion")) return handleRecordReferralConversion(id, params);
    if (method == QLatin1String("updateReferralStatus"))     return handleUpdateReferralStatus(id, params);
    if (method == QLatin1String("settlePeriod"))             return handleSettlePeriod(id, params);
    if (method == QLatin1String("reverseCommission"))        return handleReverseCommission(id, params);
    if (method == QLatin1String("claimCommissions"))         return handleClaimCommissions(id, params);
    if (method == QLatin1String("getScore"))                 return handleGetScore(id, params);
    if (method == QLatin1String("getSite"))                  return handleGetSite(id, params);
    if (method == QLatin1String("getShowcase"))              return handleGetShowcase(id, params);
    if (method == QLatin1String("getCommissionSummary"))     return handleGetCommissionSummary(id, params);
    if (method == QLatin1String("getMilestoneStatus"))       return handleGetMilestoneStatus(id, params);
    if (method == QLatin1String("runShowcase"))              return handleRunShowcase(id, params);
    if (method == QLatin1String("reconcile"))                return handleReconcile(id);

    return ServiceBase::handleRequest(request);
}

// ── Sites and users ─────────────────────────────────────────

QJsonObject GrowthService::handleRegisterSite(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    const QString ownerId = requireString(params, "ownerId");
    if (siteId.isEmpty() || ownerId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' and 'ownerId' are required"));
    }

    Tier tier = Tier::Free;
    if (params.contains(QStringLiteral("ownerTier"))) {
        const std::optional<Tier> parsed = tierFromString(requireString(params, "ownerTier"));
        if (!parsed.has_value()) {
            return invalidParams(id, QStringLiteral("'ownerTier' must be 'free' or 'pro'"));
        }
        tier = *parsed;
    }
    const qint64 createdAt = readInteger(params, "createdAt").value_or(m_clock());

    bool created = false;
    EngineError error;
    const std::optional<SiteRecord> site =
        m_engine->registerSite(siteId, ownerId, tier, createdAt, &created, &error);
    if (!site.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result = siteToJson(*site, m_clock());
    result[QStringLiteral("created")] = created;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleRetireSite(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    if (siteId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' is required"));
    }

    EngineError error;
    if (!m_engine->retireSite(siteId, &error)) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("siteId")] = siteId;
    result[QStringLiteral("retired")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleSetUserTier(uint64_t id, const QJsonObject& params)
{
    const QString userId = requireString(params, "userId");
    const std::optional<Tier> tier = tierFromString(requireString(params, "tier"));
    if (userId.isEmpty() || !tier.has_value()) {
        return invalidParams(id, QStringLiteral("'userId' and a 'tier' of 'free' or 'pro' are required"));
    }

    std::optional<qint64> expiresAt;
    const QJsonValue expiresValue = params.value(QStringLiteral("proExpiresAt"));
    if (!expiresValue.isUndefined() && !expiresValue.isNull()) {
        expiresAt = readInteger(params, "proExpiresAt");
        if (!expiresAt.has_value()) {
            return invalidParams(id, QStringLiteral("'proExpiresAt' must be epoch seconds"));
        }
    }

    EngineError error;
    if (!m_engine->setUserTier(userId, *tier, expiresAt, requireString(params, "source"), &error)) {
        return engineErrorResponse(id, error);
    }

    const std::optional<UserRecord> user = m_engine->store().getUser(userId);
    QJsonObject result;
    result[QStringLiteral("userId")] = userId;
    result[QStringLiteral("tier")] = tierToString(user.has_value() ? user->tier : *tier);
    result[QStringLiteral("proExpiresAt")] =
        optionalTime(user.has_value() ? user->proExpiresAt : expiresAt);
    return IpcMessage::makeResponse(id, result);
}

// ── Ingestion ───────────────────────────────────────────────

QJsonObject GrowthService::handleRecordShare(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    const QString key = requireString(params, "idempotencyKey");
    if (siteId.isEmpty() || key.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' and 'idempotencyKey' are required"));
    }
    const QString platformName = requireString(params, "platform");
    const std::optional<Platform> platform = platformFromString(platformName);
    if (!platform.has_value()) {
        return invalidParams(id, QStringLiteral("Unknown platform '%1'").arg(platformName));
    }
    const qint64 occurredAt = readInteger(params, "occurredAt").value_or(m_clock());

    EngineError error;
    const std::optional<EventIngestor::ShareResult> share =
        m_engine->recordShare(siteId, *platform, key, occurredAt, &error);
    if (!share.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("accepted")] = share->accepted;
    result[QStringLiteral("newShareCount")] = share->newShareCount;
    result[QStringLiteral("featuringFired")] = share->featuringFired;
    if (share->featuringFired) {
        result[QStringLiteral("featuredUntil")] = optionalTime(share->featuredUntil);
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleRecordPageview(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    const qint64 count = readInteger(params, "count").value_or(1);
    if (siteId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' is required"));
    }

    EngineError error;
    if (!m_engine->recordPageview(siteId, count, &error)) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("siteId")] = siteId;
    result[QStringLiteral("recorded")] = count;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleRecordReferralConversion(uint64_t id, const QJsonObject& params)
{
    const QString referrerId = requireString(params, "referrerId");
    const QString refereeId = requireString(params, "refereeId");
    if (referrerId.isEmpty() || refereeId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'referrerId' and 'refereeId' are required"));
    }
    const qint64 occurredAt = readInteger(params, "occurredAt").value_or(m_clock());

    ReferralStatus status = ReferralStatus::Active;
    if (params.contains(QStringLiteral("status"))) {
        const std::optional<ReferralStatus> parsed =
            referralStatusFromString(requireString(params, "status"));
        if (!parsed.has_value() || *parsed == ReferralStatus::Churned) {
            return invalidParams(id, QStringLiteral("'status' must be 'pending' or 'active'"));
        }
        status = *parsed;
    }

    EngineError error;
    const std::optional<ReferralEdge> edge =
        m_engine->recordReferralConversion(referrerId, refereeId, occurredAt, status, &error);
    if (!edge.has_value()) {
        return engineErrorResponse(id, error);
    }
    return IpcMessage::makeResponse(id, edgeToJson(*edge));
}

QJsonObject GrowthService::handleUpdateReferralStatus(uint64_t id, const QJsonObject& params)
{
    const std::optional<qint64> edgeId = readInteger(params, "edgeId");
    const std::optional<ReferralStatus> status =
        referralStatusFromString(requireString(params, "status"));
    if (!edgeId.has_value() || !status.has_value()) {
        return invalidParams(id, QStringLiteral("'edgeId' and a valid 'status' are required"));
    }

    EngineError error;
    const std::optional<ReferralEdge> edge = m_engine->updateReferralStatus(*edgeId, *status, &error);
    if (!edge.has_value()) {
        return engineErrorResponse(id, error);
    }
    return IpcMessage::makeResponse(id, edgeToJson(*edge));
}

// ── Commission ──────────────────────────────────────────────

QJsonObject GrowthService::handleSettlePeriod(uint64_t id, const QJsonObject& params)
{
    const std::optional<qint64> edgeId = readInteger(params, "edgeId");
    const QString period = requireString(params, "period");
    const std::optional<qint64> revenue = readInteger(params, "revenue");
    if (!edgeId.has_value() || period.isEmpty() || !revenue.has_value()) {
        return invalidParams(id, QStringLiteral("'edgeId', 'period' and integral 'revenue' are required"));
    }

    EngineError error;
    const std::optional<CommissionLedgerEntry> entry =
        m_engine->settlePeriod(*edgeId, period, *revenue, &error);
    if (!entry.has_value()) {
        return engineErrorResponse(id, error);
    }
    return IpcMessage::makeResponse(id, entryToJson(*entry));
}

QJsonObject GrowthService::handleReverseCommission(uint64_t id, const QJsonObject& params)
{
    const std::optional<qint64> entryId = readInteger(params, "entryId");
    if (!entryId.has_value()) {
        return invalidParams(id, QStringLiteral("'entryId' is required"));
    }

    EngineError error;
    const std::optional<CommissionLedgerEntry> reversal =
        m_engine->reverseCommission(*entryId, &error);
    if (!reversal.has_value()) {
        if (error.code == EngineErrorCode::DuplicateEvent) {
            QJsonObject result;
            result[QStringLiteral("entryId")] = *entryId;
            result[QStringLiteral("applied")] = false;
            return IpcMessage::makeResponse(id, result);
        }
        return engineErrorResponse(id, error);
    }

    QJsonObject result = entryToJson(*reversal);
    result[QStringLiteral("applied")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleClaimCommissions(uint64_t id, const QJsonObject& params)
{
    const QString userId = requireString(params, "userId");
    const QString period = requireString(params, "period");
    if (userId.isEmpty() || period.isEmpty()) {
        return invalidParams(id, QStringLiteral("'userId' and 'period' are required"));
    }

    EngineError error;
    const std::optional<int64_t> amount = m_engine->claimCommissions(userId, period, &error);
    if (!amount.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("userId")] = userId;
    result[QStringLiteral("period")] = period;
    result[QStringLiteral("amount")] = static_cast<qint64>(*amount);
    result[QStringLiteral("claimed")] = *amount > 0;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleGetCommissionSummary(uint64_t id, const QJsonObject& params)
{
    const QString userId = requireString(params, "userId");
    if (userId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'userId' is required"));
    }

    EngineError error;
    const std::optional<CommissionSummary> summary = m_engine->getCommissionSummary(userId, &error);
    if (!summary.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("userId")] = summary->userId;
    result[QStringLiteral("totalEarned")] = static_cast<qint64>(summary->totalEarned);
    result[QStringLiteral("pendingAmount")] = static_cast<qint64>(summary->pendingAmount);
    result[QStringLiteral("pendingPeriod")] = summary->pendingPeriod;
    result[QStringLiteral("currentRateBps")] = summary->currentRateBps;
    result[QStringLiteral("currentRate")] = summary->currentRateBps / 100.0;
    result[QStringLiteral("tierName")] = summary->tierName;
    result[QStringLiteral("nextTierName")] = summary->nextTierName;
    result[QStringLiteral("daysToNextTier")] = summary->daysToNextTier.has_value()
        ? QJsonValue(*summary->daysToNextTier) : QJsonValue(QJsonValue::Null);
    result[QStringLiteral("activeReferrals")] = summary->activeReferrals;
    result[QStringLiteral("lifetimePaid")] = static_cast<qint64>(summary->lifetimePaid);
    return IpcMessage::makeResponse(id, result);
}

// ── Reads ───────────────────────────────────────────────────

QJsonObject GrowthService::handleGetScore(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    if (siteId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' is required"));
    }

    EngineError error;
    const std::optional<ScoreBreakdown> breakdown = m_engine->getScoreBreakdown(siteId, &error);
    if (!breakdown.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonObject result;
    result[QStringLiteral("siteId")] = siteId;
    result[QStringLiteral("score")] = breakdown->finalScore;
    result[QStringLiteral("shareTerm")] = breakdown->shareTerm;
    result[QStringLiteral("pageviewTerm")] = breakdown->pageviewTerm;
    result[QStringLiteral("tierMultiplier")] = breakdown->tierMultiplier;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleGetSite(uint64_t id, const QJsonObject& params)
{
    const QString siteId = requireString(params, "siteId");
    if (siteId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'siteId' is required"));
    }

    EngineError error;
    const std::optional<SiteRecord> site = m_engine->getSite(siteId, &error);
    if (!site.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonArray featuring;
    for (const FeaturingEvent& event : m_engine->featuringHistory(siteId)) {
        QJsonObject json;
        json[QStringLiteral("shareMultiple")] = event.shareMultiple;
        json[QStringLiteral("durationHours")] = event.durationHours;
        json[QStringLiteral("featuredFrom")] = event.featuredFrom;
        json[QStringLiteral("featuredUntil")] = event.featuredUntil;
        featuring.append(json);
    }

    QJsonObject result = siteToJson(*site, m_clock());
    result[QStringLiteral("featuringHistory")] = featuring;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleGetShowcase(uint64_t id, const QJsonObject& params)
{
    const qint64 limit = params.contains(QStringLiteral("limit"))
        ? readInteger(params, "limit").value_or(-1) : kDefaultShowcasePage;
    const qint64 offset = params.contains(QStringLiteral("offset"))
        ? readInteger(params, "offset").value_or(-1) : 0;
    if (limit < 1 || limit > GrowthEngine::kMaxShowcasePage || offset < 0) {
        return invalidParams(id, QStringLiteral("'limit' must be in [1, %1] and 'offset' non-negative")
                                     .arg(GrowthEngine::kMaxShowcasePage));
    }

    EngineError error;
    const std::optional<std::vector<ShowcaseEntry>> page =
        m_engine->getShowcase(static_cast<int>(limit), static_cast<int>(offset), &error);
    if (!page.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonArray entries;
    for (const ShowcaseEntry& entry : *page) {
        QJsonObject json;
        json[QStringLiteral("rank")] = entry.rank;
        json[QStringLiteral("siteId")] = entry.siteId;
        json[QStringLiteral("ownerId")] = entry.ownerId;
        json[QStringLiteral("score")] = entry.score;
        json[QStringLiteral("boostLevel")] = viralBoostLevelToString(entry.boostLevel);
        entries.append(json);
    }

    QJsonObject result;
    result[QStringLiteral("entries")] = entries;
    result[QStringLiteral("total")] = m_engine->store().showcaseSize();
    result[QStringLiteral("generationId")] =
        m_engine->store().getSetting(QStringLiteral("showcaseGeneration")).value_or(QString());
    result[QStringLiteral("generatedAt")] =
        m_engine->store().getSetting(QStringLiteral("showcaseGeneratedAt")).value_or(QString()).toLongLong();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleGetMilestoneStatus(uint64_t id, const QJsonObject& params)
{
    const QString userId = requireString(params, "userId");
    if (userId.isEmpty()) {
        return invalidParams(id, QStringLiteral("'userId' is required"));
    }

    EngineError error;
    const std::optional<int> active = m_engine->store().countActiveReferrals(userId, &error);
    if (!active.has_value()) {
        return engineErrorResponse(id, error);
    }

    QJsonArray milestones;
    for (const MilestoneRecord& record : m_engine->getMilestoneStatus(userId)) {
        QJsonObject json;
        json[QStringLiteral("milestoneType")] = record.milestoneType;
        json[QStringLiteral("firedAt")] = record.firedAt;
        milestones.append(json);
    }

    const MilestoneConfig& milestone = m_config.milestone;
    QJsonObject result;
    result[QStringLiteral("userId")] = userId;
    result[QStringLiteral("activeReferrals")] = *active;
    result[QStringLiteral("milestoneType")] = milestone.milestoneType;
    result[QStringLiteral("referralThreshold")] = milestone.referralThreshold;
    result[QStringLiteral("remaining")] = std::max(0, milestone.referralThreshold - *active);
    result[QStringLiteral("milestones")] = milestones;
    return IpcMessage::makeResponse(id, result);
}

// ── Batch ───────────────────────────────────────────────────

QJsonObject GrowthService::handleRunShowcase(uint64_t id, const QJsonObject& params)
{
    const bool started = startShowcaseJob();
    if (started && params.value(QStringLiteral("wait")).toBool(false)) {
        waitForShowcaseJob();
    }

    QJsonObject result = jobStatusJson();
    result[QStringLiteral("started")] = started;
    result[QStringLiteral("alreadyRunning")] = !started;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject GrowthService::handleReconcile(uint64_t id)
{
    EngineError error;
    const std::optional<TriggerDispatcher::ReconcileReport> report = m_engine->reconcile(&error);
    if (!report.has_value()) {
        return engineErrorResponse(id, error);
    }
    return IpcMessage::makeResponse(id, reconcileToJson(*report));
}

// ── Showcase job ────────────────────────────────────────────

bool GrowthService::startShowcaseJob()
{
    bool expected = false;
    if (!m_jobRunning.compare_exchange_strong(expected, true)) {
        return false;
    }

    joinJobThreadIfNeeded();
    m_jobStartedAtMs.store(QDateTime::currentMSecsSinceEpoch());
    m_jobFinishedAtMs.store(0);
    m_jobThread = std::thread([this]() { runShowcaseJob(); });
    LOG_INFO(geRanking, "Showcase job started");
    return true;
}

void GrowthService::waitForShowcaseJob()
{
    joinJobThreadIfNeeded();
}

void GrowthService::runShowcaseJob()
{
    QJsonObject outcome;
    EngineError error;
    std::unique_ptr<GrowthEngine> engine = GrowthEngine::open(m_config, m_clock, &error);
    if (!engine) {
        outcome[QStringLiteral("ok")] = false;
        outcome[QStringLiteral("error")] = error.message;
    } else {
        // Heal lost notifications before ranking from durable state.
        const std::optional<TriggerDispatcher::ReconcileReport> report = engine->reconcile(&error);
        if (report.has_value()) {
            outcome[QStringLiteral("reconcile")] = reconcileToJson(*report);
        } else {
            LOG_WARN(geRanking, "Reconcile before showcase run failed: %s", qPrintable(error.message));
        }

        const std::optional<ShowcaseRanker::RunResult> run = engine->runShowcase(&error);
        outcome[QStringLiteral("ok")] = run.has_value();
        if (run.has_value()) {
            outcome[QStringLiteral("run")] = runToJson(*run);
        } else {
            outcome[QStringLiteral("error")] = error.message;
            LOG_ERROR(geRanking, "Showcase job failed, previous ranking kept: %s",
                      qPrintable(error.message));
        }
    }

    {
        QMutexLocker lock(&m_jobMutex);
        m_lastJobResult = outcome;
    }
    m_jobFinishedAtMs.store(QDateTime::currentMSecsSinceEpoch());
    m_jobRunning.store(false);
}

QJsonObject GrowthService::jobStatusJson() const
{
    QJsonObject result;
    result[QStringLiteral("running")] = m_jobRunning.load();
    result[QStringLiteral("startedAtMs")] = m_jobStartedAtMs.load();
    result[QStringLiteral("finishedAtMs")] = m_jobFinishedAtMs.load();
    QMutexLocker lock(&m_jobMutex);
    if (!m_lastJobResult.isEmpty()) {
        result[QStringLiteral("lastResult")] = m_lastJobResult;
    }
    return result;
}

void GrowthService::joinJobThreadIfNeeded()
{
    if (m_jobThread.joinable() && m_jobThread.get_id() != std::this_thread::get_id()) {
        m_jobThread.join();
    }
}

void GrowthService::broadcastNotification(const GrowthNotification& notification)
{
    QJsonObject params;
    params[QStringLiteral("occurredAt")] = notification.occurredAt;
    params[QStringLiteral("publishedAt")] = notification.publishedAt;
    if (notification.kind == NotificationKind::ShareRecorded) {
        params[QStringLiteral("siteId")] = notification.siteId;
        params[QStringLiteral("platform")] = platformToString(notification.platform);
        params[QStringLiteral("totalShares")] = notification.totalShares;
    } else {
        params[QStringLiteral("edgeId")] = static_cast<qint64>(notification.edgeId);
        params[QStringLiteral("referrerId")] = notification.referrerId;
        params[QStringLiteral("refereeId")] = notification.refereeId;
    }
    sendNotification(notificationKindToString(notification.kind), params);
}

} // namespace ge
