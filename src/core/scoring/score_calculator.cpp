#include "core/scoring/score_calculator.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace ge {

ScoreCalculator::ScoreCalculator(const ScoringConfig& config)
    : m_config(config)
{
    if (m_config.halfLifeHours > 0.0) {
        m_lambda = std::log(2.0) / m_config.halfLifeHours;
    } else {
        LOG_WARN(geScoring, "Non-positive half-life %.3f, decay disabled", m_config.halfLifeHours);
    }
}

double ScoreCalculator::platformWeight(Platform platform) const
{
    const auto it = m_config.platformWeights.find(platform);
    if (it == m_config.platformWeights.end()) {
        return 0.0;
    }
    return std::max(0.0, it->second);
}

double ScoreCalculator::decayedShareWeight(Platform platform, qint64 occurredAt, qint64 now) const
{
    const double weight = platformWeight(platform);
    if (weight <= 0.0) {
        return 0.0;
    }
    const qint64 ageSeconds = std::max<qint64>(0, now - occurredAt);
    const double ageHours = static_cast<double>(ageSeconds) / 3600.0;
    return weight * std::exp(-m_lambda * ageHours);
}

ScoreBreakdown ScoreCalculator::computeScore(const SiteRecord& site,
                                             const std::vector<ShareEvent>& events,
                                             qint64 now) const
{
    ScoreBreakdown breakdown;

    // Floating-point addition is not associative; summing in a canonical
    // order makes the result independent of the order events were loaded in.
    std::vector<const ShareEvent*> ordered;
    ordered.reserve(events.size());
    for (const ShareEvent& event : events) {
        ordered.push_back(&event);
    }
    std::sort(ordered.begin(), ordered.end(), [](const ShareEvent* a, const ShareEvent* b) {
        return std::make_tuple(a->occurredAt, static_cast<int>(a->platform), a->idempotencyKey)
             < std::make_tuple(b->occurredAt, static_cast<int>(b->platform), b->idempotencyKey);
    });

    for (const ShareEvent* event : ordered) {
        breakdown.shareTerm += decayedShareWeight(event->platform, event->occurredAt, now);
    }

    if (site.pageviews > 0 && m_config.pageviewWeight > 0.0) {
        breakdown.pageviewTerm = m_config.pageviewWeight
                                 * std::log1p(static_cast<double>(site.pageviews));
    }

    breakdown.tierMultiplier = site.tier == Tier::Pro ? std::max(1.0, m_config.proMultiplier) : 1.0;
    breakdown.finalScore = (breakdown.shareTerm + breakdown.pageviewTerm) * breakdown.tierMultiplier;
    if (!(breakdown.finalScore > 0.0)) {
        breakdown.finalScore = 0.0;
    }
    return breakdown;
}

} // namespace ge
