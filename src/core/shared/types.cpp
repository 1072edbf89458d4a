#include "core/shared/types.h"

namespace ge {

QString tierToString(Tier tier)
{
    switch (tier) {
    case Tier::Free: return QStringLiteral("free");
    case Tier::Pro:  return QStringLiteral("pro");
    }
    return QStringLiteral("free");
}

std::optional<Tier> tierFromString(const QString& str)
{
    if (str == QLatin1String("free")) return Tier::Free;
    if (str == QLatin1String("pro"))  return Tier::Pro;
    return std::nullopt;
}

QString platformToString(Platform platform)
{
    switch (platform) {
    case Platform::Twitter:    return QStringLiteral("twitter");
    case Platform::LinkedIn:   return QStringLiteral("linkedin");
    case Platform::Facebook:   return QStringLiteral("facebook");
    case Platform::Email:      return QStringLiteral("email");
    case Platform::CopyLink:   return QStringLiteral("copy_link");
    case Platform::Reddit:     return QStringLiteral("reddit");
    case Platform::HackerNews: return QStringLiteral("hackernews");
    case Platform::Discord:    return QStringLiteral("discord");
    case Platform::Slack:      return QStringLiteral("slack");
    case Platform::Other:      return QStringLiteral("other");
    }
    return QStringLiteral("other");
}

std::optional<Platform> platformFromString(const QString& str)
{
    for (Platform platform : allPlatforms()) {
        if (platformToString(platform) == str) {
            return platform;
        }
    }
    return std::nullopt;
}

const std::vector<Platform>& allPlatforms()
{
    static const std::vector<Platform> platforms = {
        Platform::Twitter,
        Platform::LinkedIn,
        Platform::Facebook,
        Platform::Email,
        Platform::CopyLink,
        Platform::Reddit,
        Platform::HackerNews,
        Platform::Discord,
        Platform::Slack,
        Platform::Other,
    };
    return platforms;
}

QString referralStatusToString(ReferralStatus status)
{
    switch (status) {
    case ReferralStatus::Pending: return QStringLiteral("pending");
    case ReferralStatus::Active:  return QStringLiteral("active");
    case ReferralStatus::Churned: return QStringLiteral("churned");
    }
    return QStringLiteral("pending");
}

std::optional<ReferralStatus> referralStatusFromString(const QString& str)
{
    if (str == QLatin1String("pending")) return ReferralStatus::Pending;
    if (str == QLatin1String("active"))  return ReferralStatus::Active;
    if (str == QLatin1String("churned")) return ReferralStatus::Churned;
    return std::nullopt;
}

QString entryKindToString(EntryKind kind)
{
    switch (kind) {
    case EntryKind::Settlement: return QStringLiteral("settlement");
    case EntryKind::Reversal:   return QStringLiteral("reversal");
    }
    return QStringLiteral("settlement");
}

EntryKind entryKindFromString(const QString& str)
{
    if (str == QLatin1String("reversal")) return EntryKind::Reversal;
    return EntryKind::Settlement;
}

QString settlementStatusToString(SettlementStatus status)
{
    switch (status) {
    case SettlementStatus::Pending: return QStringLiteral("pending");
    case SettlementStatus::Paid:    return QStringLiteral("paid");
    }
    return QStringLiteral("pending");
}

SettlementStatus settlementStatusFromString(const QString& str)
{
    if (str == QLatin1String("paid")) return SettlementStatus::Paid;
    return SettlementStatus::Pending;
}

QString viralBoostLevelToString(ViralBoostLevel level)
{
    switch (level) {
    case ViralBoostLevel::None:     return QStringLiteral("none");
    case ViralBoostLevel::Bronze:   return QStringLiteral("bronze");
    case ViralBoostLevel::Silver:   return QStringLiteral("silver");
    case ViralBoostLevel::Gold:     return QStringLiteral("gold");
    case ViralBoostLevel::Platinum: return QStringLiteral("platinum");
    case ViralBoostLevel::Viral:    return QStringLiteral("viral");
    }
    return QStringLiteral("none");
}

ViralBoostLevel viralBoostLevelFromString(const QString& str)
{
    if (str == QLatin1String("bronze"))   return ViralBoostLevel::Bronze;
    if (str == QLatin1String("silver"))   return ViralBoostLevel::Silver;
    if (str == QLatin1String("gold"))     return ViralBoostLevel::Gold;
    if (str == QLatin1String("platinum")) return ViralBoostLevel::Platinum;
    if (str == QLatin1String("viral"))    return ViralBoostLevel::Viral;
    return ViralBoostLevel::None;
}

ViralBoostLevel viralBoostLevelForShares(int64_t totalShares)
{
    if (totalShares <= 0)   return ViralBoostLevel::None;
    if (totalShares <= 5)   return ViralBoostLevel::Bronze;
    if (totalShares <= 15)  return ViralBoostLevel::Silver;
    if (totalShares <= 50)  return ViralBoostLevel::Gold;
    if (totalShares <= 100) return ViralBoostLevel::Platinum;
    return ViralBoostLevel::Viral;
}

} // namespace ge
