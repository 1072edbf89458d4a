#include "core/engine/growth_engine.h"
#include "core/commission/billing_period.h"
#include "core/shared/config_manager.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace ge {

std::unique_ptr<GrowthEngine> GrowthEngine::open(const EngineConfig& config, Clock clock,
                                                 EngineError* error)
{
    if (!ConfigManager::validate(config, error)) {
        return nullptr;
    }
    if (config.dbPath.trimmed().isEmpty()) {
        setError(error, EngineErrorCode::InvalidArgument, QStringLiteral("dbPath is not configured"));
        return nullptr;
    }

    std::optional<LedgerStore> store = LedgerStore::open(config.dbPath);
    if (!store.has_value()) {
        setError(error, EngineErrorCode::TransientStoreError,
                 QStringLiteral("Cannot open ledger at %1").arg(config.dbPath));
        return nullptr;
    }
    // The constructor is private, so std::make_unique cannot reach it.
    return std::unique_ptr<GrowthEngine>(
        new GrowthEngine(std::move(*store), config, clock ? std::move(clock) : systemClock()));
}

GrowthEngine::GrowthEngine(LedgerStore store, const EngineConfig& config, Clock clock)
    : m_config(config)
    , m_clock(std::move(clock))
    , m_store(std::move(store))
    , m_scorer(m_config.scoring)
    , m_commission(m_config.commission)
    , m_ingestor(m_store, m_config.ingest, m_clock, m_config.featuring)
    , m_dispatcher(m_store, m_config.featuring, m_config.milestone)
    , m_ranker(m_store, m_config.scoring)
{
    m_ingestor.subscribe([this](const GrowthNotification& notification) {
        m_dispatcher.handle(notification);
    });
}

// ── Sites and users ─────────────────────────────────────────

std::optional<SiteRecord> GrowthEngine::registerSite(const QString& siteId, const QString& ownerId,
                                                     Tier ownerTier, qint64 createdAt,
                                                     bool* created, EngineError* error)
{
    if (siteId.trimmed().isEmpty() || ownerId.trimmed().isEmpty()) {
        setError(error, EngineErrorCode::InvalidArgument, QStringLiteral("siteId and ownerId are required"));
        return std::nullopt;
    }
    return m_store.registerSite(siteId, ownerId, ownerTier, createdAt, created, error);
}

bool GrowthEngine::retireSite(const QString& siteId, EngineError* error)
{
    return m_store.retireSite(siteId, m_clock(), error);
}

bool GrowthEngine::setUserTier(const QString& userId, Tier tier, std::optional<qint64> proExpiresAt,
                               const QString& source, EngineError* error)
{
    const qint64 now = m_clock();
    if (tier == Tier::Pro && proExpiresAt.has_value() && *proExpiresAt <= now) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("proExpiresAt must be in the future"));
        return false;
    }
    return m_store.setUserTier(userId, tier, proExpiresAt,
                               source.isEmpty() ? QStringLiteral("manual") : source, now, error);
}

std::optional<SiteRecord> GrowthEngine::getSite(const QString& siteId, EngineError* error)
{
    return m_store.getSite(siteId, error);
}

std::vector<FeaturingEvent> GrowthEngine::featuringHistory(const QString& siteId)
{
    return m_store.featuringEventsForSite(siteId);
}

// ── Ingestion ───────────────────────────────────────────────

std::optional<EventIngestor::ShareResult> GrowthEngine::recordShare(const QString& siteId,
                                                                    Platform platform,
                                                                    const QString& idempotencyKey,
                                                                    qint64 occurredAt,
                                                                    EngineError* error)
{
    return m_ingestor.recordShare(siteId, platform, idempotencyKey, occurredAt, error);
}

bool GrowthEngine::recordPageview(const QString& siteId, int64_t count, EngineError* error)
{
    return m_ingestor.recordPageview(siteId, count, error);
}

std::optional<ReferralEdge> GrowthEngine::recordReferralConversion(const QString& referrerId,
                                                                   const QString& refereeId,
                                                                   qint64 occurredAt,
                                                                   EngineError* error)
{
    return m_ingestor.recordReferralConversion(referrerId, refereeId, occurredAt, error);
}

std::optional<ReferralEdge> GrowthEngine::recordReferralConversion(const QString& referrerId,
                                                                   const QString& refereeId,
                                                                   qint64 occurredAt,
                                                                   ReferralStatus initialStatus,
                                                                   EngineError* error)
{
    return m_ingestor.recordReferralConversion(referrerId, refereeId, occurredAt, initialStatus,
                                               error);
}

std::optional<ReferralEdge> GrowthEngine::updateReferralStatus(int64_t edgeId, ReferralStatus status,
                                                               EngineError* error)
{
    const qint64 now = m_clock();
    std::optional<ReferralEdge> edge = m_store.updateReferralStatus(edgeId, status, now, error);
    if (edge.has_value() && edge->status == ReferralStatus::Active) {
        // An activation can complete the milestone count.
        EngineError milestoneError;
        if (!m_dispatcher.onReferralConverted(edge->referrerId, now, &milestoneError)) {
            LOG_WARN(geTrigger, "Milestone check after activation failed for %s: %s",
                     qUtf8Printable(edge->referrerId), qUtf8Printable(milestoneError.message));
        }
    }
    return edge;
}

std::vector<ReferralEdge> GrowthEngine::referrals(const QString& referrerId)
{
    return m_store.referralEdgesForReferrer(referrerId);
}

// ── Commission ──────────────────────────────────────────────

std::optional<CommissionLedgerEntry> GrowthEngine::settlePeriod(int64_t edgeId, const QString& period,
                                                                int64_t periodRevenue,
                                                                EngineError* error)
{
    const std::optional<BillingPeriod> billing = parseBillingPeriod(period);
    if (!billing.has_value()) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Invalid billing period '%1', expected YYYY-MM").arg(period));
        return std::nullopt;
    }

    const std::optional<ReferralEdge> edge = m_store.getReferralEdge(edgeId, error);
    if (!edge.has_value()) {
        return std::nullopt;
    }
    if (edge->status == ReferralStatus::Pending) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Referral %1 is not active yet").arg(edgeId));
        return std::nullopt;
    }

    const std::optional<CommissionCalculator::PeriodSettlement> settlement =
        m_commission.settlePeriod(*edge, *billing, periodRevenue, error);
    if (!settlement.has_value()) {
        return std::nullopt;
    }

    // Guard the financial invariants again at the append boundary.
    if (settlement->payableAmount < 0 || settlement->payableAmount > periodRevenue) {
        LOG_ERROR(geCommission, "Payable %lld outside [0, %lld] for edge %lld period %s",
                  static_cast<long long>(settlement->payableAmount),
                  static_cast<long long>(periodRevenue), static_cast<long long>(edgeId),
                  qUtf8Printable(period));
        setError(error, EngineErrorCode::InvariantViolation,
                 QStringLiteral("Computed payable is outside [0, revenue]"));
        return std::nullopt;
    }

    CommissionLedgerEntry entry;
    entry.edgeId = edgeId;
    entry.period = billing->id;
    entry.periodStart = billing->start;
    entry.periodEnd = billing->end;
    entry.rateBps = settlement->rateBps;
    entry.baseAmount = periodRevenue;
    entry.payableAmount = settlement->payableAmount;
    entry.createdAt = m_clock();

    std::optional<CommissionLedgerEntry> stored = m_store.appendSettlement(entry, error);
    if (stored.has_value()) {
        LOG_INFO(geCommission, "Settled edge %lld for %s: base=%lld rate=%dbps payable=%lld%s",
                 static_cast<long long>(edgeId), qUtf8Printable(billing->id),
                 static_cast<long long>(periodRevenue), settlement->rateBps,
                 static_cast<long long>(settlement->payableAmount),
                 settlement->blended ? " (blended)" : "");
    }
    return stored;
}

std::optional<CommissionLedgerEntry> GrowthEngine::reverseCommission(int64_t entryId, EngineError* error)
{
    std::optional<CommissionLedgerEntry> reversal = m_store.appendReversal(entryId, m_clock(), error);
    if (reversal.has_value()) {
        LOG_INFO(geCommission, "Reversed commission entry %lld (%lld)",
                 static_cast<long long>(entryId), static_cast<long long>(reversal->payableAmount));
    }
    return reversal;
}

std::optional<int64_t> GrowthEngine::claimCommissions(const QString& userId, const QString& period,
                                                      EngineError* error)
{
    if (!parseBillingPeriod(period).has_value()) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Invalid billing period '%1', expected YYYY-MM").arg(period));
        return std::nullopt;
    }
    if (!m_store.getUser(userId).has_value()) {
        setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown user: %1").arg(userId));
        return std::nullopt;
    }
    return m_store.claimPeriod(userId, period, m_clock(), error);
}

std::optional<CommissionSummary> GrowthEngine::getCommissionSummary(const QString& userId,
                                                                    EngineError* error)
{
    if (!m_store.getUser(userId).has_value()) {
        setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown user: %1").arg(userId));
        return std::nullopt;
    }

    const qint64 now = m_clock();
    CommissionSummary summary;
    summary.userId = userId;

    const std::vector<CommissionLedgerEntry> entries = m_store.commissionEntriesForReferrer(userId);
    std::set<int64_t> reversed;
    for (const CommissionLedgerEntry& entry : entries) {
        if (entry.kind == EntryKind::Reversal) {
            reversed.insert(entry.reversesEntryId);
            summary.totalEarned -= entry.payableAmount;
        } else {
            summary.totalEarned += entry.payableAmount;
        }
    }
    for (const CommissionLedgerEntry& entry : entries) {
        if (entry.kind != EntryKind::Settlement
            || entry.settlementStatus != SettlementStatus::Pending
            || reversed.count(entry.id) > 0) {
            continue;
        }
        summary.pendingAmount += entry.payableAmount;
        if (entry.period > summary.pendingPeriod) {
            summary.pendingPeriod = entry.period;
        }
    }

    // The oldest active relationship carries the highest rate.
    std::optional<qint64> oldestConversion;
    for (const ReferralEdge& edge : m_store.referralEdgesForReferrer(userId)) {
        if (edge.status != ReferralStatus::Active) {
            continue;
        }
        ++summary.activeReferrals;
        if (!oldestConversion.has_value() || edge.convertedAt < *oldestConversion) {
            oldestConversion = edge.convertedAt;
        }
    }

    const double age = oldestConversion.has_value()
        ? CommissionCalculator::ageInYears(*oldestConversion, now)
        : 0.0;
    summary.currentRateBps = m_commission.rateBpsForAge(age);
    summary.tierName = m_commission.tierForAge(age);

    const std::optional<CommissionBreakpoint> next = m_commission.nextBreakpoint(age);
    if (next.has_value()) {
        summary.nextTierName = next->tierName;
        if (oldestConversion.has_value()) {
            const qint64 reachAt = CommissionCalculator::breakpointTime(*oldestConversion, *next);
            summary.daysToNextTier = static_cast<int>(
                std::ceil(static_cast<double>(std::max<qint64>(0, reachAt - now)) / 86400.0));
        }
    }

    summary.lifetimePaid = m_store.lifetimeClaimed(userId);
    return summary;
}

// ── Reads ───────────────────────────────────────────────────

std::optional<ScoreBreakdown> GrowthEngine::getScoreBreakdown(const QString& siteId, EngineError* error)
{
    const std::optional<SiteRecord> site = m_store.getSite(siteId, error);
    if (!site.has_value()) {
        return std::nullopt;
    }
    return m_scorer.computeScore(*site, m_store.shareEventsForSite(siteId), m_clock());
}

std::optional<double> GrowthEngine::getScore(const QString& siteId, EngineError* error)
{
    const std::optional<ScoreBreakdown> breakdown = getScoreBreakdown(siteId, error);
    if (!breakdown.has_value()) {
        return std::nullopt;
    }
    return breakdown->finalScore;
}

std::optional<std::vector<ShowcaseEntry>> GrowthEngine::getShowcase(int limit, int offset,
                                                                    EngineError* error)
{
    if (limit < 1 || limit > kMaxShowcasePage || offset < 0) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("limit must be in [1, %1] and offset non-negative").arg(kMaxShowcasePage));
        return std::nullopt;
    }
    return m_store.showcasePage(limit, offset);
}

std::vector<MilestoneRecord> GrowthEngine::getMilestoneStatus(const QString& userId)
{
    return m_store.milestonesForUser(userId);
}

// ── Batch ───────────────────────────────────────────────────

std::optional<ShowcaseRanker::RunResult> GrowthEngine::runShowcase(EngineError* error)
{
    return m_ranker.run(m_clock(), error);
}

std::optional<TriggerDispatcher::ReconcileReport> GrowthEngine::reconcile(EngineError* error)
{
    return m_dispatcher.reconcile(m_clock(), error);
}

} // namespace ge
