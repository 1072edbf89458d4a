#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/types.h"

#include <vector>

namespace ge {

struct ScoreBreakdown {
    double shareTerm = 0.0;       // sum of decayed platform-weighted shares
    double pageviewTerm = 0.0;    // pageviewWeight * log1p(pageviews)
    double tierMultiplier = 1.0;
    double finalScore = 0.0;
};

// ScoreCalculator -- pure viral score of one site.
//
//   score = (sum_p w(p) * exp(-lambda * age_h) + pvWeight * log1p(pageviews)) * tierMult
//   lambda = ln 2 / halfLifeHours
//
// No clock reads and no shared state: the same events, tier and `now`
// always give a bit-identical result.
class ScoreCalculator {
public:
    explicit ScoreCalculator(const ScoringConfig& config = {});

    ScoreBreakdown computeScore(const SiteRecord& site,
                                const std::vector<ShareEvent>& events,
                                qint64 now) const;

    double score(const SiteRecord& site,
                 const std::vector<ShareEvent>& events,
                 qint64 now) const
    {
        return computeScore(site, events, now).finalScore;
    }

    // Contribution of a single share. Events dated after `now` count as fresh.
    double decayedShareWeight(Platform platform, qint64 occurredAt, qint64 now) const;

    double platformWeight(Platform platform) const;
    double decayRatePerHour() const { return m_lambda; }

    const ScoringConfig& config() const { return m_config; }

private:
    ScoringConfig m_config;
    double m_lambda = 0.0;
};

} // namespace ge
