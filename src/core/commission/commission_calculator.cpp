#include "core/commission/commission_calculator.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ge {

namespace {

constexpr int64_t kBpsDenominator = 10000;
// Keeps revenue * 10000 inside int64.
constexpr int64_t kMaxPeriodRevenue = INT64_MAX / kBpsDenominator;

} // namespace

CommissionCalculator::CommissionCalculator(const CommissionConfig& config)
    : m_config(config)
{
    m_valid = !m_config.schedule.empty();
    for (size_t i = 1; i < m_config.schedule.size() && m_valid; ++i) {
        const CommissionBreakpoint& prev = m_config.schedule[i - 1];
        const CommissionBreakpoint& cur = m_config.schedule[i];
        if (cur.minAgeYears <= prev.minAgeYears || cur.rateBps < prev.rateBps) {
            m_valid = false;
        }
    }
    if (!m_valid) {
        LOG_ERROR(geCommission, "Commission schedule is empty or not monotonic; settlements disabled");
    }
}

double CommissionCalculator::ageInYears(qint64 convertedAt, qint64 at)
{
    if (at <= convertedAt) {
        return 0.0;
    }
    return static_cast<double>(at - convertedAt) / kSecondsPerYear;
}

const CommissionBreakpoint& CommissionCalculator::breakpointForAge(double ageYears) const
{
    static const CommissionBreakpoint kNone;
    if (m_config.schedule.empty()) {
        return kNone;
    }
    const CommissionBreakpoint* current = &m_config.schedule.front();
    for (const CommissionBreakpoint& bp : m_config.schedule) {
        if (ageYears >= bp.minAgeYears) {
            current = &bp;
        } else {
            break;
        }
    }
    return *current;
}

int CommissionCalculator::rateBpsForAge(double ageYears) const
{
    return breakpointForAge(ageYears).rateBps;
}

double CommissionCalculator::rateForAge(double ageYears) const
{
    return static_cast<double>(rateBpsForAge(ageYears)) / 100.0;
}

QString CommissionCalculator::tierForAge(double ageYears) const
{
    return breakpointForAge(ageYears).tierName;
}

std::optional<CommissionBreakpoint> CommissionCalculator::nextBreakpoint(double ageYears) const
{
    for (const CommissionBreakpoint& bp : m_config.schedule) {
        if (bp.minAgeYears > ageYears) {
            return bp;
        }
    }
    return std::nullopt;
}

qint64 CommissionCalculator::breakpointTime(qint64 convertedAt, const CommissionBreakpoint& breakpoint)
{
    return convertedAt + static_cast<qint64>(std::llround(breakpoint.minAgeYears * kSecondsPerYear));
}

int64_t CommissionCalculator::roundHalfEvenDiv(int64_t numerator, int64_t denominator)
{
    const int64_t quotient = numerator / denominator;
    const int64_t remainder = numerator % denominator;
    const int64_t twice = remainder * 2;
    if (twice > denominator) {
        return quotient + 1;
    }
    if (twice == denominator) {
        return (quotient % 2 == 0) ? quotient : quotient + 1;
    }
    return quotient;
}

int64_t CommissionCalculator::roundHalfEven(long double value)
{
    const long double floorValue = std::floor(value);
    const long double diff = value - floorValue;
    const int64_t base = static_cast<int64_t>(floorValue);
    if (diff > 0.5L) {
        return base + 1;
    }
    if (diff < 0.5L) {
        return base;
    }
    return (base % 2 == 0) ? base : base + 1;
}

int64_t CommissionCalculator::payable(const ReferralEdge& edge, int64_t periodRevenue, qint64 now) const
{
    if (periodRevenue <= 0 || !m_valid) {
        return 0;
    }
    const int64_t revenue = std::min(periodRevenue, kMaxPeriodRevenue);
    const int rate = rateBpsForAge(ageInYears(edge.convertedAt, now));
    return roundHalfEvenDiv(revenue * rate, kBpsDenominator);
}

std::optional<CommissionCalculator::PeriodSettlement> CommissionCalculator::settlePeriod(
    const ReferralEdge& edge, const BillingPeriod& period, int64_t periodRevenue,
    EngineError* error) const
{
    if (!m_valid) {
        LOG_ERROR(geCommission, "Refusing to settle edge %lld: commission schedule violates monotonicity",
                  static_cast<long long>(edge.id));
        setError(error, EngineErrorCode::InvariantViolation,
                 QStringLiteral("Commission schedule is not monotonic"));
        return std::nullopt;
    }
    if (periodRevenue < 0 || periodRevenue > kMaxPeriodRevenue) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Period revenue out of range: %1").arg(periodRevenue));
        return std::nullopt;
    }

    const qint64 windowStart = std::max(period.start, edge.convertedAt);
    const qint64 windowEnd = period.end;
    if (windowEnd <= windowStart) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Period %1 ends before referral %2 converted")
                     .arg(period.id).arg(edge.id));
        return std::nullopt;
    }

    // Segment boundaries: window edges plus every breakpoint strictly inside.
    std::vector<qint64> cuts = {windowStart};
    for (const CommissionBreakpoint& bp : m_config.schedule) {
        const qint64 at = breakpointTime(edge.convertedAt, bp);
        if (at > windowStart && at < windowEnd) {
            cuts.push_back(at);
        }
    }
    cuts.push_back(windowEnd);

    PeriodSettlement settlement;
    settlement.blended = cuts.size() > 2;

    if (!settlement.blended) {
        settlement.rateBps = rateBpsForAge(ageInYears(edge.convertedAt, windowStart));
        settlement.payableAmount = roundHalfEvenDiv(periodRevenue * settlement.rateBps, kBpsDenominator);
        return settlement;
    }

    int64_t weightedBpsSeconds = 0;
    for (size_t i = 0; i + 1 < cuts.size(); ++i) {
        const qint64 segmentStart = cuts[i];
        const qint64 segmentSeconds = cuts[i + 1] - segmentStart;
        const int rate = rateBpsForAge(ageInYears(edge.convertedAt, segmentStart));
        weightedBpsSeconds += static_cast<int64_t>(rate) * segmentSeconds;
    }
    const int64_t windowSeconds = windowEnd - windowStart;
    const long double effectiveBps = static_cast<long double>(weightedBpsSeconds)
                                     / static_cast<long double>(windowSeconds);

    settlement.rateBps = static_cast<int>(roundHalfEven(effectiveBps));
    settlement.payableAmount = roundHalfEven(static_cast<long double>(periodRevenue) * effectiveBps
                                             / static_cast<long double>(kBpsDenominator));
    settlement.payableAmount = std::clamp<int64_t>(settlement.payableAmount, 0, periodRevenue);

    LOG_DEBUG(geCommission, "Edge %lld period %s blended at %.4f bps over %d segment(s)",
              static_cast<long long>(edge.id), qUtf8Printable(period.id), static_cast<double>(effectiveBps),
              static_cast<int>(cuts.size() - 1));
    return settlement;
}

} // namespace ge
