#pragma once

#include "core/shared/types.h"

#include <QString>
#include <map>
#include <vector>

namespace ge {

inline std::map<Platform, double> defaultPlatformWeights()
{
    return {
        {Platform::HackerNews, 8.0},
        {Platform::Reddit,     6.0},
        {Platform::Twitter,    5.0},
        {Platform::LinkedIn,   4.0},
        {Platform::Email,      4.0},
        {Platform::Discord,    3.0},
        {Platform::Slack,      3.0},
        {Platform::Facebook,   3.0},
        {Platform::CopyLink,   2.0},
        {Platform::Other,      2.0},
    };
}

// Viral score parameters. Platform weights are a fixed lookup table.
struct ScoringConfig {
    std::map<Platform, double> platformWeights = defaultPlatformWeights();
    double halfLifeHours = 240.0;      // 10 days
    double pageviewWeight = 1.0;       // multiplies log1p(pageviews)
    double proMultiplier = 1.5;
};

struct FeaturingConfig {
    int shareThreshold = 5;
    int freeDurationHours = 48;
    int proDurationHours = 168;
};

struct MilestoneConfig {
    QString milestoneType = QStringLiteral("10-referrals-free-pro");
    int referralThreshold = 10;
    int rewardMonths = 12;
};

struct CommissionBreakpoint {
    QString tierName;
    double minAgeYears = 0.0;
    int rateBps = 0;                   // 2000 = 20%
};

// Step schedule ordered by minAgeYears. The first breakpoint starts at 0
// and rates never decrease with age.
struct CommissionConfig {
    std::vector<CommissionBreakpoint> schedule = {
        {QStringLiteral("new"),         0.0, 2000},
        {QStringLiteral("established"), 1.0, 2500},
        {QStringLiteral("legacy"),      4.0, 4000},
    };
};

struct IngestConfig {
    int maxAttempts = 5;
    int backoffStepMs = 50;
};

struct RankerConfig {
    int intervalHours = 24;
    bool runOnStart = true;
};

struct EngineConfig {
    QString dbPath;

    ScoringConfig scoring;
    FeaturingConfig featuring;
    MilestoneConfig milestone;
    CommissionConfig commission;
    IngestConfig ingest;
    RankerConfig ranker;
};

} // namespace ge
