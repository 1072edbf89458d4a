#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <functional>

namespace ge {

enum class NotificationKind {
    ShareRecorded,
    ReferralConverted,
};

inline QString notificationKindToString(NotificationKind kind)
{
    switch (kind) {
    case NotificationKind::ShareRecorded:     return QStringLiteral("shareRecorded");
    case NotificationKind::ReferralConverted: return QStringLiteral("referralConverted");
    }
    return QStringLiteral("unknown");
}

// Internal event published by the ingestor after a durable write.
// Delivery is best effort; the reconciliation sweep recovers lost ones
// from ledger state.
struct GrowthNotification {
    NotificationKind kind = NotificationKind::ShareRecorded;

    // ShareRecorded
    QString siteId;
    Platform platform = Platform::Other;
    int totalShares = 0;

    // ReferralConverted
    int64_t edgeId = 0;
    QString referrerId;
    QString refereeId;

    qint64 occurredAt = 0;
    qint64 publishedAt = 0;
};

using NotificationHandler = std::function<void(const GrowthNotification&)>;

} // namespace ge
