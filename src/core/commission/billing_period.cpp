#include "core/commission/billing_period.h"

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>

namespace ge {

namespace {

BillingPeriod makePeriod(int year, int month)
{
    const QDate first(year, month, 1);
    BillingPeriod period;
    period.year = year;
    period.month = month;
    period.id = QStringLiteral("%1-%2").arg(year, 4, 10, QLatin1Char('0'))
                                       .arg(month, 2, 10, QLatin1Char('0'));
    period.start = QDateTime(first, QTime(0, 0), Qt::UTC).toSecsSinceEpoch();
    period.end = QDateTime(first.addMonths(1), QTime(0, 0), Qt::UTC).toSecsSinceEpoch();
    return period;
}

} // namespace

std::optional<BillingPeriod> parseBillingPeriod(const QString& id)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{4})-(\\d{2})$"));
    const QRegularExpressionMatch match = pattern.match(id);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int year = match.captured(1).toInt();
    const int month = match.captured(2).toInt();
    if (year < 1970 || month < 1 || month > 12) {
        return std::nullopt;
    }
    return makePeriod(year, month);
}

BillingPeriod billingPeriodContaining(qint64 timestamp)
{
    const QDate date = QDateTime::fromSecsSinceEpoch(timestamp, Qt::UTC).date();
    return makePeriod(date.year(), date.month());
}

} // namespace ge
