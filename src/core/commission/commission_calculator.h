#pragma once

#include "core/commission/billing_period.h"
#include "core/shared/engine_config.h"
#include "core/shared/engine_error.h"
#include "core/shared/types.h"

#include <cstdint>
#include <optional>

namespace ge {

// CommissionCalculator -- progressive referral commission arithmetic.
//
// Rates are a step function of the relationship's age in years, read from
// the configured breakpoints and expressed in basis points (2000 = 20%).
// Amounts are integer minor currency units rounded half-to-even.
class CommissionCalculator {
public:
    static constexpr double kSecondsPerYear = 365.25 * 86400.0;

    explicit CommissionCalculator(const CommissionConfig& config = {});

    // False when the schedule is empty or its rates decrease with age.
    // Every settlement is refused on an invalid schedule.
    bool isValid() const { return m_valid; }

    static double ageInYears(qint64 convertedAt, qint64 at);

    const CommissionBreakpoint& breakpointForAge(double ageYears) const;
    int rateBpsForAge(double ageYears) const;
    double rateForAge(double ageYears) const;          // percentage, 20.0 for 2000 bps
    QString tierForAge(double ageYears) const;
    std::optional<CommissionBreakpoint> nextBreakpoint(double ageYears) const;

    // Epoch second at which the edge reaches `breakpoint`.
    static qint64 breakpointTime(qint64 convertedAt, const CommissionBreakpoint& breakpoint);

    // periodRevenue * Rate(age at now), single rounding.
    int64_t payable(const ReferralEdge& edge, int64_t periodRevenue, qint64 now) const;

    struct PeriodSettlement {
        int rateBps = 0;               // effective rate, rounded to whole bps
        int64_t payableAmount = 0;
        bool blended = false;          // a breakpoint falls inside the billable window
    };

    // Rate the whole period's revenue. The billable window is
    // [max(period.start, convertedAt), period.end); when a breakpoint falls
    // inside it, each segment's step rate is weighted by its duration.
    std::optional<PeriodSettlement> settlePeriod(const ReferralEdge& edge,
                                                 const BillingPeriod& period,
                                                 int64_t periodRevenue,
                                                 EngineError* error = nullptr) const;

    static int64_t roundHalfEvenDiv(int64_t numerator, int64_t denominator);
    static int64_t roundHalfEven(long double value);

    const CommissionConfig& config() const { return m_config; }

private:
    CommissionConfig m_config;
    bool m_valid = false;
};

} // namespace ge
