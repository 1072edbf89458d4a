#include "core/showcase/showcase_ranker.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QUuid>

#include <algorithm>

namespace ge {

namespace {

struct Scored {
    const LedgerStore::ShowcaseCandidate* candidate = nullptr;
    double score = 0.0;
};

} // namespace

ShowcaseRanker::ShowcaseRanker(LedgerStore& store, const ScoringConfig& scoring)
    : m_store(store)
    , m_calculator(scoring)
{
}

std::vector<ShowcaseEntry> ShowcaseRanker::rank(
    const std::vector<LedgerStore::ShowcaseCandidate>& candidates, qint64 now) const
{
    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const LedgerStore::ShowcaseCandidate& candidate : candidates) {
        scored.push_back({&candidate, m_calculator.score(candidate.site, candidate.events, now)});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.candidate->site.createdAt != b.candidate->site.createdAt) {
            return a.candidate->site.createdAt < b.candidate->site.createdAt;
        }
        return a.candidate->site.id < b.candidate->site.id;
    });

    std::vector<ShowcaseEntry> entries;
    entries.reserve(scored.size());
    int rank = 1;
    for (const Scored& item : scored) {
        ShowcaseEntry entry;
        entry.rank = rank++;
        entry.siteId = item.candidate->site.id;
        entry.ownerId = item.candidate->site.ownerId;
        entry.score = item.score;
        entry.boostLevel = viralBoostLevelForShares(item.candidate->ownerTotalShares);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<ShowcaseRanker::RunResult> ShowcaseRanker::run(qint64 now, EngineError* error)
{
    QElapsedTimer timer;
    timer.start();

    const std::optional<std::vector<LedgerStore::ShowcaseCandidate>> candidates =
        m_store.loadShowcaseCandidates(error);
    if (!candidates.has_value()) {
        LOG_WARN(geRanking, "Showcase run aborted: snapshot read failed, previous ranking kept");
        return std::nullopt;
    }

    RunResult result;
    result.generationId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    result.generatedAt = now;

    std::vector<ShowcaseEntry> entries = rank(*candidates, now);
    for (ShowcaseEntry& entry : entries) {
        entry.generationId = result.generationId;
        entry.generatedAt = now;
    }

    if (!m_store.replaceShowcase(entries, result.generationId, now, error)) {
        LOG_WARN(geRanking, "Showcase run aborted: replace failed, previous ranking kept");
        return std::nullopt;
    }

    result.entryCount = static_cast<int>(entries.size());
    result.elapsedMs = timer.elapsed();
    LOG_INFO(geRanking, "Showcase generation %s: %d site(s) ranked in %lld ms",
             qUtf8Printable(result.generationId), result.entryCount,
             static_cast<long long>(result.elapsedMs));
    return result;
}

} // namespace ge
