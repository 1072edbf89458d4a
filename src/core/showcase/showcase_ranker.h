#pragma once

#include "core/ledger/ledger_store.h"
#include "core/scoring/score_calculator.h"
#include "core/shared/engine_error.h"

#include <QString>
#include <optional>
#include <vector>

namespace ge {

// ShowcaseRanker -- periodic batch ranking of eligible sites.
//
// Reads every eligible site and its share history from one snapshot,
// scores them with "now" fixed at job start, orders by
// (score DESC, createdAt ASC, siteId ASC) and replaces the stored ranking
// in a single transaction. A failed run leaves the previous ranking intact.
class ShowcaseRanker {
public:
    ShowcaseRanker(LedgerStore& store, const ScoringConfig& scoring = {});

    struct RunResult {
        QString generationId;
        qint64 generatedAt = 0;
        int entryCount = 0;
        qint64 elapsedMs = 0;
    };

    std::optional<RunResult> run(qint64 now, EngineError* error = nullptr);

    // Pure ranking step, exposed for tests: assigns contiguous ranks from 1.
    std::vector<ShowcaseEntry> rank(const std::vector<LedgerStore::ShowcaseCandidate>& candidates,
                                    qint64 now) const;

private:
    LedgerStore& m_store;
    ScoreCalculator m_calculator;
};

} // namespace ge
