#include "core/trigger/trigger_dispatcher.h"
#include "core/shared/logging.h"

#include <vector>

namespace ge {

TriggerDispatcher::TriggerDispatcher(LedgerStore& store,
                                     const FeaturingConfig& featuring,
                                     const MilestoneConfig& milestone)
    : m_store(store)
    , m_featuring(featuring)
    , m_milestone(milestone)
{
}

bool TriggerDispatcher::isTriggerCount(int totalShares, int threshold)
{
    return threshold > 0 && totalShares > 0 && totalShares % threshold == 0;
}

int TriggerDispatcher::featuringDurationHours(Tier tier) const
{
    return tier == Tier::Pro ? m_featuring.proDurationHours : m_featuring.freeDurationHours;
}

LedgerStore::MilestoneReward TriggerDispatcher::milestoneReward() const
{
    LedgerStore::MilestoneReward reward;
    reward.milestoneType = m_milestone.milestoneType;
    reward.referralThreshold = m_milestone.referralThreshold;
    reward.rewardMonths = m_milestone.rewardMonths;
    return reward;
}

void TriggerDispatcher::handle(const GrowthNotification& notification)
{
    EngineError error;
    switch (notification.kind) {
    case NotificationKind::ShareRecorded:
        if (!onShareRecorded(notification.siteId, notification.totalShares,
                             notification.publishedAt, &error)) {
            LOG_WARN(geTrigger, "Featuring check failed for %s (%s): %s",
                     qUtf8Printable(notification.siteId),
                     qUtf8Printable(engineErrorCodeToString(error.code)),
                     qUtf8Printable(error.message));
        }
        break;
    case NotificationKind::ReferralConverted:
        if (!onReferralConverted(notification.referrerId, notification.publishedAt, &error)) {
            LOG_WARN(geTrigger, "Milestone check failed for %s (%s): %s",
                     qUtf8Printable(notification.referrerId),
                     qUtf8Printable(engineErrorCodeToString(error.code)),
                     qUtf8Printable(error.message));
        }
        break;
    }
}

std::optional<LedgerStore::FeaturingOutcome> TriggerDispatcher::onShareRecorded(
    const QString& siteId, int totalShares, qint64 now, EngineError* error)
{
    if (!isTriggerCount(totalShares, m_featuring.shareThreshold)) {
        return LedgerStore::FeaturingOutcome{};
    }

    const std::optional<SiteRecord> site = m_store.getSite(siteId, error);
    if (!site.has_value()) {
        return std::nullopt;
    }

    const int durationHours = featuringDurationHours(site->tier);
    std::optional<LedgerStore::FeaturingOutcome> outcome =
        m_store.applyFeaturingTrigger(siteId, totalShares, durationHours, now, error);
    if (!outcome.has_value()) {
        return std::nullopt;
    }

    if (outcome->fired) {
        LOG_INFO(geTrigger, "Auto-featuring fired: site=%s multiple=%d duration=%dh until=%lld",
                 qUtf8Printable(siteId), totalShares, durationHours,
                 static_cast<long long>(outcome->featuredUntil.value_or(0)));
    } else {
        LOG_DEBUG(geTrigger, "Featuring multiple %d for %s already handled (last=%d)",
                  totalShares, qUtf8Printable(siteId), outcome->lastTriggeredMultiple);
    }
    return outcome;
}

std::optional<LedgerStore::MilestoneOutcome> TriggerDispatcher::onReferralConverted(
    const QString& referrerId, qint64 now, EngineError* error)
{
    std::optional<LedgerStore::MilestoneOutcome> outcome =
        m_store.grantMilestoneIfQualified(referrerId, milestoneReward(), now, error);
    if (!outcome.has_value()) {
        return std::nullopt;
    }

    if (outcome->granted) {
        LOG_INFO(geTrigger, "Milestone %s granted to %s at %d active referrals",
                 qUtf8Printable(m_milestone.milestoneType), qUtf8Printable(referrerId),
                 outcome->activeReferrals);
    }
    return outcome;
}

std::optional<TriggerDispatcher::ReconcileReport> TriggerDispatcher::reconcile(qint64 now,
                                                                               EngineError* error)
{
    ReconcileReport report;

    const std::optional<int> expired = m_store.expireProTiers(now, error);
    if (!expired.has_value()) {
        return std::nullopt;
    }
    report.tiersExpired = *expired;

    const int threshold = m_featuring.shareThreshold;
    const std::optional<std::vector<LedgerStore::MissedTrigger>> missedTriggers =
        m_store.sitesWithMissedTriggers(threshold, error);
    if (!missedTriggers.has_value()) {
        return std::nullopt;
    }
    for (const LedgerStore::MissedTrigger& missed : *missedTriggers) {
        const int multiple = (missed.totalShares / threshold) * threshold;
        EngineError itemError;
        const std::optional<LedgerStore::FeaturingOutcome> outcome =
            m_store.applyFeaturingTrigger(missed.siteId, multiple,
                                          featuringDurationHours(missed.ownerTier), now, &itemError);
        if (!outcome.has_value()) {
            ++report.failures;
            LOG_WARN(geTrigger, "Reconcile: featuring for %s failed: %s",
                     qUtf8Printable(missed.siteId), qUtf8Printable(itemError.message));
            continue;
        }
        if (outcome->fired) {
            ++report.featuringFired;
            LOG_INFO(geTrigger, "Reconcile: recovered featuring for %s at multiple %d",
                     qUtf8Printable(missed.siteId), multiple);
        }
    }

    const LedgerStore::MilestoneReward reward = milestoneReward();
    const std::optional<std::vector<QString>> referrers =
        m_store.referrersMissingMilestone(reward.referralThreshold, reward.milestoneType, error);
    if (!referrers.has_value()) {
        return std::nullopt;
    }
    for (const QString& referrerId : *referrers) {
        EngineError itemError;
        const std::optional<LedgerStore::MilestoneOutcome> outcome =
            m_store.grantMilestoneIfQualified(referrerId, reward, now, &itemError);
        if (!outcome.has_value()) {
            ++report.failures;
            LOG_WARN(geTrigger, "Reconcile: milestone for %s failed: %s",
                     qUtf8Printable(referrerId), qUtf8Printable(itemError.message));
            continue;
        }
        if (outcome->granted) {
            ++report.milestonesGranted;
            LOG_INFO(geTrigger, "Reconcile: recovered milestone for %s", qUtf8Printable(referrerId));
        }
    }

    LOG_INFO(geTrigger, "Reconcile done: expired=%d featuring=%d milestones=%d failures=%d",
             report.tiersExpired, report.featuringFired, report.milestonesGranted, report.failures);
    return report;
}

} // namespace ge
