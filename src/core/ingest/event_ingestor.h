#pragma once

#include "core/ingest/growth_notification.h"
#include "core/ledger/ledger_store.h"
#include "core/shared/clock.h"
#include "core/shared/engine_config.h"
#include "core/shared/engine_error.h"

#include <QString>
#include <optional>
#include <vector>

namespace ge {

// EventIngestor -- entry point for share, referral and pageview events.
//
// Writes go through the caller's LedgerStore connection. Transient store
// failures (SQLITE_BUSY and friends) are retried here with linear backoff;
// once attempts run out the caller gets TransientStoreError and may resend
// with the same idempotency key.
class EventIngestor {
public:
    EventIngestor(LedgerStore& store, const IngestConfig& config = {},
                  Clock clock = systemClock(), const FeaturingConfig& featuring = {});

    struct ShareResult {
        bool accepted = false;
        int newShareCount = 0;
        bool featuringFired = false;
        std::optional<qint64> featuredUntil;
    };

    // Exactly-once per idempotency key. A repeated key yields
    // accepted = false and the current count; it is not an error.
    // The featuring check for the new count commits with the share.
    std::optional<ShareResult> recordShare(const QString& siteId, Platform platform,
                                           const QString& idempotencyKey, qint64 occurredAt,
                                           EngineError* error = nullptr);

    // Fails with DuplicateConversion while a non-churned edge exists for the pair.
    std::optional<ReferralEdge> recordReferralConversion(const QString& referrerId,
                                                         const QString& refereeId,
                                                         qint64 occurredAt,
                                                         EngineError* error = nullptr);

    // initialStatus is Active or Pending; a pending edge counts toward the
    // milestone once it is activated.
    std::optional<ReferralEdge> recordReferralConversion(const QString& referrerId,
                                                         const QString& refereeId,
                                                         qint64 occurredAt,
                                                         ReferralStatus initialStatus,
                                                         EngineError* error = nullptr);

    bool recordPageview(const QString& siteId, int64_t count, EngineError* error = nullptr);

    // Handlers run synchronously after the write commits, in subscription order.
    void subscribe(NotificationHandler handler);

private:
    template <typename Result, typename Operation>
    std::optional<Result> withRetry(const char* operation, Operation&& op, EngineError* error);

    void publish(const GrowthNotification& notification);

    LedgerStore& m_store;
    IngestConfig m_config;
    Clock m_clock;
    LedgerStore::FeaturingPolicy m_featuring;
    std::vector<NotificationHandler> m_handlers;
};

} // namespace ge
