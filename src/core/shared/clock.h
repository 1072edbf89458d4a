#pragma once

#include <QDateTime>
#include <functional>

namespace ge {

// Source of "now" in epoch seconds. Tests inject a fixed clock.
using Clock = std::function<qint64()>;

inline Clock systemClock()
{
    return [] { return QDateTime::currentSecsSinceEpoch(); };
}

} // namespace ge
