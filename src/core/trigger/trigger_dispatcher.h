#pragma once

#include "core/ingest/growth_notification.h"
#include "core/ledger/ledger_store.h"
#include "core/shared/engine_config.h"
#include "core/shared/engine_error.h"

#include <optional>

namespace ge {

// TriggerDispatcher -- one-time and repeatable side effects of counter
// crossings.
//
// Featuring (per site, re-entrant Normal -> Featured -> Normal): fires when
// total shares is a non-zero multiple of the threshold and that multiple is
// above the stored last-triggered multiple. The ingestor fires it inside the
// share transaction; here it covers shares appended without a policy and
// the reconcile sweep. The store's compare-and-swap makes re-delivery of the
// same notification a no-op.
//
// Milestone (per user): the conditional insert into milestones is the only
// idempotency guard; a losing concurrent delivery sees granted = false.
class TriggerDispatcher {
public:
    TriggerDispatcher(LedgerStore& store,
                      const FeaturingConfig& featuring = {},
                      const MilestoneConfig& milestone = {});

    // NotificationHandler entry point.
    void handle(const GrowthNotification& notification);

    static bool isTriggerCount(int totalShares, int threshold);

    int featuringDurationHours(Tier tier) const;

    // Nullopt on store failure. fired = false when the count is not a
    // trigger multiple or the multiple was already handled.
    std::optional<LedgerStore::FeaturingOutcome> onShareRecorded(const QString& siteId,
                                                                 int totalShares,
                                                                 qint64 now,
                                                                 EngineError* error = nullptr);

    std::optional<LedgerStore::MilestoneOutcome> onReferralConverted(const QString& referrerId,
                                                                     qint64 now,
                                                                     EngineError* error = nullptr);

    struct ReconcileReport {
        int tiersExpired = 0;
        int featuringFired = 0;
        int milestonesGranted = 0;
        int failures = 0;
    };

    // Recompute triggers from durable counters: expire lapsed pro tiers,
    // fire the highest missed featuring multiple per site, and evaluate
    // milestones for referrers at or above the threshold without a record.
    std::optional<ReconcileReport> reconcile(qint64 now, EngineError* error = nullptr);

private:
    LedgerStore::MilestoneReward milestoneReward() const;

    LedgerStore& m_store;
    FeaturingConfig m_featuring;
    MilestoneConfig m_milestone;
};

} // namespace ge
