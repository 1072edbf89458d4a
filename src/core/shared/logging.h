#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(geCore)
Q_DECLARE_LOGGING_CATEGORY(geLedger)
Q_DECLARE_LOGGING_CATEGORY(geScoring)
Q_DECLARE_LOGGING_CATEGORY(geTrigger)
Q_DECLARE_LOGGING_CATEGORY(geCommission)
Q_DECLARE_LOGGING_CATEGORY(geRanking)
Q_DECLARE_LOGGING_CATEGORY(geIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
