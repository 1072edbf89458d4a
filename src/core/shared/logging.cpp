#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(geCore, "growthengine.core")
Q_LOGGING_CATEGORY(geLedger, "growthengine.ledger")
Q_LOGGING_CATEGORY(geScoring, "growthengine.scoring")
Q_LOGGING_CATEGORY(geTrigger, "growthengine.trigger")
Q_LOGGING_CATEGORY(geCommission, "growthengine.commission")
Q_LOGGING_CATEGORY(geRanking, "growthengine.ranking")
Q_LOGGING_CATEGORY(geIpc, "growthengine.ipc")
