#pragma once

#include <QString>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace ge {

// Subscription tier of a site owner
enum class Tier {
    Free,
    Pro,
};

QString tierToString(Tier tier);
std::optional<Tier> tierFromString(const QString& str);

// External platforms a site can be shared to
enum class Platform {
    Twitter,
    LinkedIn,
    Facebook,
    Email,
    CopyLink,
    Reddit,
    HackerNews,
    Discord,
    Slack,
    Other,
};

QString platformToString(Platform platform);
std::optional<Platform> platformFromString(const QString& str);
const std::vector<Platform>& allPlatforms();

enum class ReferralStatus {
    Pending,
    Active,
    Churned,
};

QString referralStatusToString(ReferralStatus status);
std::optional<ReferralStatus> referralStatusFromString(const QString& str);

// Settlement entries carry money owed; reversals cancel one settlement.
enum class EntryKind {
    Settlement,
    Reversal,
};

QString entryKindToString(EntryKind kind);
EntryKind entryKindFromString(const QString& str);

enum class SettlementStatus {
    Pending,
    Paid,
};

QString settlementStatusToString(SettlementStatus status);
SettlementStatus settlementStatusFromString(const QString& str);

// Owner-level boost derived from total external shares across sites
enum class ViralBoostLevel {
    None,
    Bronze,
    Silver,
    Gold,
    Platinum,
    Viral,
};

QString viralBoostLevelToString(ViralBoostLevel level);
ViralBoostLevel viralBoostLevelFromString(const QString& str);
ViralBoostLevel viralBoostLevelForShares(int64_t totalShares);

// ── Ledger records ──────────────────────────────────────────

struct UserRecord {
    QString id;
    Tier tier = Tier::Free;
    std::optional<qint64> proExpiresAt;
    qint64 createdAt = 0;
};

struct SiteRecord {
    QString id;
    QString ownerId;
    Tier tier = Tier::Free;            // owner's current tier
    qint64 createdAt = 0;
    int64_t pageviews = 0;
    int totalShares = 0;
    int lastTriggeredMultiple = 0;
    std::optional<qint64> autoFeaturedUntil;
    bool showcaseEligible = false;
    std::optional<qint64> retiredAt;
    int64_t version = 0;
    std::map<Platform, int> platformShares;

    bool isFeatured(qint64 now) const
    {
        return autoFeaturedUntil.has_value() && *autoFeaturedUntil > now;
    }
};

struct ShareEvent {
    QString siteId;
    Platform platform = Platform::Other;
    QString idempotencyKey;
    qint64 occurredAt = 0;
};

struct FeaturingEvent {
    QString siteId;
    int shareMultiple = 0;
    int durationHours = 0;
    qint64 featuredFrom = 0;
    qint64 featuredUntil = 0;
};

struct ReferralEdge {
    int64_t id = 0;
    QString referrerId;
    QString refereeId;
    qint64 convertedAt = 0;
    ReferralStatus status = ReferralStatus::Active;
};

struct CommissionLedgerEntry {
    int64_t id = 0;
    int64_t edgeId = 0;
    QString period;
    qint64 periodStart = 0;
    qint64 periodEnd = 0;
    EntryKind kind = EntryKind::Settlement;
    int64_t reversesEntryId = 0;
    int rateBps = 0;
    int64_t baseAmount = 0;     // minor currency units
    int64_t payableAmount = 0;  // minor currency units, never negative
    SettlementStatus settlementStatus = SettlementStatus::Pending;
    qint64 createdAt = 0;
};

struct MilestoneRecord {
    QString userId;
    QString milestoneType;
    qint64 firedAt = 0;
};

struct ShowcaseEntry {
    int rank = 0;
    QString siteId;
    QString ownerId;
    double score = 0.0;
    ViralBoostLevel boostLevel = ViralBoostLevel::None;
    QString generationId;
    qint64 generatedAt = 0;
};

} // namespace ge
