#include "core/ingest/event_ingestor.h"
#include "core/shared/logging.h"

#include <QThread>

#include <algorithm>
#include <exception>
#include <utility>

namespace ge {

EventIngestor::EventIngestor(LedgerStore& store, const IngestConfig& config, Clock clock,
                             const FeaturingConfig& featuring)
    : m_store(store)
    , m_config(config)
    , m_clock(std::move(clock))
{
    m_featuring.shareThreshold = featuring.shareThreshold;
    m_featuring.freeDurationHours = featuring.freeDurationHours;
    m_featuring.proDurationHours = featuring.proDurationHours;
}

void EventIngestor::subscribe(NotificationHandler handler)
{
    if (handler) {
        m_handlers.push_back(std::move(handler));
    }
}

template <typename Result, typename Operation>
std::optional<Result> EventIngestor::withRetry(const char* operation, Operation&& op,
                                               EngineError* error)
{
    const int maxAttempts = std::max(1, m_config.maxAttempts);
    EngineError lastError;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        EngineError attemptError;
        std::optional<Result> result = op(&attemptError);
        if (result.has_value()) {
            return result;
        }
        if (!isRetryable(attemptError.code)) {
            if (error) {
                *error = attemptError;
            }
            return std::nullopt;
        }
        lastError = attemptError;
        if (attempt < maxAttempts) {
            const int delayMs = m_config.backoffStepMs * attempt;
            LOG_WARN(geLedger, "%s: transient failure on attempt %d/%d, retrying in %d ms",
                     operation, attempt, maxAttempts, delayMs);
            QThread::msleep(static_cast<unsigned long>(delayMs));
        }
    }

    LOG_WARN(geLedger, "%s: giving up after %d attempts: %s", operation, maxAttempts,
             qUtf8Printable(lastError.message));
    setError(error, EngineErrorCode::TransientStoreError,
             QStringLiteral("%1: store unavailable, retry with the same key")
                 .arg(QLatin1String(operation)));
    return std::nullopt;
}

void EventIngestor::publish(const GrowthNotification& notification)
{
    for (const NotificationHandler& handler : m_handlers) {
        try {
            handler(notification);
        } catch (const std::exception& e) {
            // The write is already durable; reconciliation recovers the reaction.
            LOG_WARN(geTrigger, "Notification handler failed for %s: %s",
                     qUtf8Printable(notificationKindToString(notification.kind)), e.what());
        }
    }
}

std::optional<EventIngestor::ShareResult> EventIngestor::recordShare(const QString& siteId,
                                                                     Platform platform,
                                                                     const QString& idempotencyKey,
                                                                     qint64 occurredAt,
                                                                     EngineError* error)
{
    if (siteId.trimmed().isEmpty()) {
        setError(error, EngineErrorCode::InvalidArgument, QStringLiteral("siteId is required"));
        return std::nullopt;
    }
    if (idempotencyKey.trimmed().isEmpty()) {
        setError(error, EngineErrorCode::InvalidArgument, QStringLiteral("idempotencyKey is required"));
        return std::nullopt;
    }

    ShareEvent event;
    event.siteId = siteId;
    event.platform = platform;
    event.idempotencyKey = idempotencyKey;
    event.occurredAt = occurredAt;

    const qint64 recordedAt = m_clock();
    const std::optional<LedgerStore::ShareAppendResult> appended =
        withRetry<LedgerStore::ShareAppendResult>("recordShare", [&](EngineError* attemptError) {
            return m_store.appendShareEvent(event, recordedAt, m_featuring, attemptError);
        }, error);
    if (!appended.has_value()) {
        return std::nullopt;
    }

    ShareResult result;
    result.accepted = appended->accepted;
    result.newShareCount = appended->totalShares;

    if (!appended->accepted) {
        if (appended->siteId != siteId) {
            LOG_WARN(geLedger, "Share key %s reused for site %s (recorded against %s)",
                     qUtf8Printable(idempotencyKey), qUtf8Printable(siteId),
                     qUtf8Printable(appended->siteId));
        }
        return result;
    }

    LOG_DEBUG(geLedger, "Share recorded: site=%s platform=%s total=%d",
              qUtf8Printable(siteId), qUtf8Printable(platformToString(platform)),
              appended->totalShares);

    if (appended->featuringFired) {
        result.featuringFired = true;
        result.featuredUntil = appended->featuredUntil;
        LOG_INFO(geTrigger, "Auto-featuring fired: site=%s multiple=%d duration=%dh until=%lld",
                 qUtf8Printable(siteId), appended->totalShares, appended->featuringDurationHours,
                 static_cast<long long>(appended->featuredUntil.value_or(0)));
    }

    GrowthNotification notification;
    notification.kind = NotificationKind::ShareRecorded;
    notification.siteId = siteId;
    notification.platform = platform;
    notification.totalShares = appended->totalShares;
    notification.occurredAt = occurredAt;
    notification.publishedAt = m_clock();
    publish(notification);

    return result;
}

std::optional<ReferralEdge> EventIngestor::recordReferralConversion(const QString& referrerId,
                                                                    const QString& refereeId,
                                                                    qint64 occurredAt,
                                                                    EngineError* error)
{
    return recordReferralConversion(referrerId, refereeId, occurredAt, ReferralStatus::Active, error);
}

std::optional<ReferralEdge> EventIngestor::recordReferralConversion(const QString& referrerId,
                                                                    const QString& refereeId,
                                                                    qint64 occurredAt,
                                                                    ReferralStatus initialStatus,
                                                                    EngineError* error)
{
    if (initialStatus == ReferralStatus::Churned) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("A referral starts as pending or active"));
        return std::nullopt;
    }
    if (referrerId.trimmed().isEmpty() || refereeId.trimmed().isEmpty()) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("referrerId and refereeId are required"));
        return std::nullopt;
    }
    if (referrerId == refereeId) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("A user cannot refer themselves"));
        return std::nullopt;
    }

    const qint64 now = m_clock();
    const std::optional<ReferralEdge> edge =
        withRetry<ReferralEdge>("recordReferralConversion", [&](EngineError* attemptError) {
            return m_store.insertReferralEdge(referrerId, refereeId, occurredAt,
                                              initialStatus, now, attemptError);
        }, error);
    if (!edge.has_value()) {
        return std::nullopt;
    }

    LOG_INFO(geLedger, "Referral converted: %s -> %s (edge %lld, %s)", qUtf8Printable(referrerId),
             qUtf8Printable(refereeId), static_cast<long long>(edge->id),
             qUtf8Printable(referralStatusToString(edge->status)));

    GrowthNotification notification;
    notification.kind = NotificationKind::ReferralConverted;
    notification.edgeId = edge->id;
    notification.referrerId = referrerId;
    notification.refereeId = refereeId;
    notification.occurredAt = occurredAt;
    notification.publishedAt = m_clock();
    publish(notification);

    return edge;
}

bool EventIngestor::recordPageview(const QString& siteId, int64_t count, EngineError* error)
{
    if (siteId.trimmed().isEmpty() || count <= 0) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("recordPageview needs a siteId and a positive count"));
        return false;
    }

    const std::optional<bool> applied =
        withRetry<bool>("recordPageview", [&](EngineError* attemptError) -> std::optional<bool> {
            if (!m_store.addPageviews(siteId, count, attemptError)) {
                return std::nullopt;
            }
            return true;
        }, error);
    return applied.has_value();
}

} // namespace ge
