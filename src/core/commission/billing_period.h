#pragma once

#include <QString>
#include <optional>

namespace ge {

// Calendar month in UTC, identified as "YYYY-MM". [start, end) in epoch seconds.
struct BillingPeriod {
    QString id;
    int year = 0;
    int month = 0;
    qint64 start = 0;
    qint64 end = 0;

    qint64 lengthSeconds() const { return end - start; }
    bool contains(qint64 ts) const { return ts >= start && ts < end; }
};

std::optional<BillingPeriod> parseBillingPeriod(const QString& id);
BillingPeriod billingPeriodContaining(qint64 timestamp);

} // namespace ge
