#pragma once

#include "core/commission/commission_calculator.h"
#include "core/ingest/event_ingestor.h"
#include "core/ledger/ledger_store.h"
#include "core/scoring/score_calculator.h"
#include "core/shared/clock.h"
#include "core/shared/engine_config.h"
#include "core/shared/engine_error.h"
#include "core/showcase/showcase_ranker.h"
#include "core/trigger/trigger_dispatcher.h"

#include <QString>
#include <memory>
#include <optional>
#include <vector>

namespace ge {

struct CommissionSummary {
    QString userId;
    int64_t totalEarned = 0;        // settlements minus reversals, minor units
    int64_t pendingAmount = 0;      // unpaid and unreversed
    QString pendingPeriod;          // latest period with a pending amount
    int currentRateBps = 0;
    QString tierName;
    QString nextTierName;
    std::optional<int> daysToNextTier;
    int activeReferrals = 0;
    int64_t lifetimePaid = 0;
};

// GrowthEngine -- one handler context over one ledger connection.
//
// Wires the ingestor's notifications to the trigger dispatcher and exposes
// the read and write operations collaborators call. Instances are not
// shared between threads: every concurrent caller opens its own engine on
// the same database file.
class GrowthEngine {
public:
    static std::unique_ptr<GrowthEngine> open(const EngineConfig& config,
                                              Clock clock = systemClock(),
                                              EngineError* error = nullptr);

    GrowthEngine(const GrowthEngine&) = delete;
    GrowthEngine& operator=(const GrowthEngine&) = delete;

    // ── Sites and users ─────────────────────────────────────

    std::optional<SiteRecord> registerSite(const QString& siteId, const QString& ownerId,
                                           Tier ownerTier, qint64 createdAt,
                                           bool* created = nullptr, EngineError* error = nullptr);
    bool retireSite(const QString& siteId, EngineError* error = nullptr);
    bool setUserTier(const QString& userId, Tier tier, std::optional<qint64> proExpiresAt,
                     const QString& source, EngineError* error = nullptr);
    std::optional<SiteRecord> getSite(const QString& siteId, EngineError* error = nullptr);
    std::vector<FeaturingEvent> featuringHistory(const QString& siteId);

    // ── Ingestion ───────────────────────────────────────────

    std::optional<EventIngestor::ShareResult> recordShare(const QString& siteId, Platform platform,
                                                          const QString& idempotencyKey,
                                                          qint64 occurredAt,
                                                          EngineError* error = nullptr);
    bool recordPageview(const QString& siteId, int64_t count, EngineError* error = nullptr);
    std::optional<ReferralEdge> recordReferralConversion(const QString& referrerId,
                                                         const QString& refereeId,
                                                         qint64 occurredAt,
                                                         EngineError* error = nullptr);
    std::optional<ReferralEdge> recordReferralConversion(const QString& referrerId,
                                                         const QString& refereeId,
                                                         qint64 occurredAt,
                                                         ReferralStatus initialStatus,
                                                         EngineError* error = nullptr);
    std::optional<ReferralEdge> updateReferralStatus(int64_t edgeId, ReferralStatus status,
                                                     EngineError* error = nullptr);
    std::vector<ReferralEdge> referrals(const QString& referrerId);

    // ── Commission ──────────────────────────────────────────

    std::optional<CommissionLedgerEntry> settlePeriod(int64_t edgeId, const QString& period,
                                                      int64_t periodRevenue,
                                                      EngineError* error = nullptr);
    std::optional<CommissionLedgerEntry> reverseCommission(int64_t entryId,
                                                           EngineError* error = nullptr);
    std::optional<int64_t> claimCommissions(const QString& userId, const QString& period,
                                            EngineError* error = nullptr);
    std::optional<CommissionSummary> getCommissionSummary(const QString& userId,
                                                          EngineError* error = nullptr);

    // ── Reads ───────────────────────────────────────────────

    std::optional<double> getScore(const QString& siteId, EngineError* error = nullptr);
    std::optional<ScoreBreakdown> getScoreBreakdown(const QString& siteId,
                                                    EngineError* error = nullptr);
    std::optional<std::vector<ShowcaseEntry>> getShowcase(int limit, int offset,
                                                          EngineError* error = nullptr);
    std::vector<MilestoneRecord> getMilestoneStatus(const QString& userId);

    // ── Batch ───────────────────────────────────────────────

    std::optional<ShowcaseRanker::RunResult> runShowcase(EngineError* error = nullptr);
    std::optional<TriggerDispatcher::ReconcileReport> reconcile(EngineError* error = nullptr);

    static constexpr int kMaxShowcasePage = 500;

    const EngineConfig& config() const { return m_config; }
    LedgerStore& store() { return m_store; }
    EventIngestor& ingestor() { return m_ingestor; }
    TriggerDispatcher& dispatcher() { return m_dispatcher; }
    const CommissionCalculator& commission() const { return m_commission; }

private:
    GrowthEngine(LedgerStore store, const EngineConfig& config, Clock clock);

    EngineConfig m_config;
    Clock m_clock;
    LedgerStore m_store;
    ScoreCalculator m_scorer;
    CommissionCalculator m_commission;
    EventIngestor m_ingestor;
    TriggerDispatcher m_dispatcher;
    ShowcaseRanker m_ranker;
};

} // namespace ge
