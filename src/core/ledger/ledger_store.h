#pragma once

#include "core/shared/engine_error.h"
#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace ge {

// LedgerStore -- owner of one SQLite connection to the event ledger.
//
// Every thread or request handler opens its own LedgerStore on the same
// database file; the file is the only shared mutable state in the engine.
// Multi-statement mutations run inside BEGIN IMMEDIATE so counter updates
// for one site are linearizable across connections and processes.
//
// Exactly-once facts (share events, live referral edges, settlements,
// reversals, milestones, featuring multiples, claims) are guarded by
// UNIQUE indexes in the schema, never by application-level locks.
class LedgerStore {
public:
    ~LedgerStore();

    // Move-only (owns sqlite3* handle)
    LedgerStore(LedgerStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    LedgerStore& operator=(LedgerStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    // Open or create the ledger at dbPath. Creates the schema and applies
    // pending migrations on first open.
    static std::optional<LedgerStore> open(const QString& dbPath);

    // ── Users and sites ─────────────────────────────────────

    std::optional<UserRecord> getUser(const QString& userId);

    // Change a user's tier, append subscription_history and recompute
    // showcase eligibility of the user's live sites, all in one transaction.
    // A Free tier always clears proExpiresAt.
    bool setUserTier(const QString& userId, Tier tier,
                     std::optional<qint64> proExpiresAt,
                     const QString& source, qint64 now,
                     EngineError* error = nullptr);

    // Create the owner on first sight, then the site. A site id that
    // already exists is returned unchanged with *created = false.
    std::optional<SiteRecord> registerSite(const QString& siteId, const QString& ownerId,
                                           Tier ownerTier, qint64 createdAt,
                                           bool* created = nullptr,
                                           EngineError* error = nullptr);

    // Soft-retire. Retiring twice is a no-op.
    bool retireSite(const QString& siteId, qint64 now, EngineError* error = nullptr);

    std::optional<SiteRecord> getSite(const QString& siteId, EngineError* error = nullptr);

    bool addPageviews(const QString& siteId, int64_t count, EngineError* error = nullptr);

    // ── Share ledger ────────────────────────────────────────

    // Featuring rule applied inside the share transaction. A zero
    // threshold appends without evaluating featuring.
    struct FeaturingPolicy {
        int shareThreshold = 0;
        int freeDurationHours = 0;
        int proDurationHours = 0;
    };

    struct ShareAppendResult {
        bool accepted = false;
        QString siteId;            // site the idempotency key belongs to
        int totalShares = 0;       // value read inside the incrementing transaction
        int lastTriggeredMultiple = 0;
        bool featuringFired = false;
        int featuringDurationHours = 0;
        std::optional<qint64> featuredUntil;
    };

    // Append the event and increment per-platform and total counters in one
    // write transaction. A known idempotency key returns accepted = false
    // and the current count without touching any counter.
    std::optional<ShareAppendResult> appendShareEvent(const ShareEvent& event,
                                                      qint64 recordedAt,
                                                      EngineError* error = nullptr);

    // As above, and when the new count is a non-zero multiple of the policy
    // threshold the featuring swap and its featuring_events row land before
    // COMMIT. Every crossing is therefore seen by exactly one caller, in
    // increasing order, under the write lock.
    std::optional<ShareAppendResult> appendShareEvent(const ShareEvent& event,
                                                      qint64 recordedAt,
                                                      const FeaturingPolicy& featuring,
                                                      EngineError* error = nullptr);

    std::vector<ShareEvent> shareEventsForSite(const QString& siteId);

    // ── Featuring ───────────────────────────────────────────

    struct FeaturingOutcome {
        bool fired = false;
        int lastTriggeredMultiple = 0;
        std::optional<qint64> featuredUntil;
    };

    // Compare-and-swap on sites.last_triggered_multiple: fires only when
    // shareMultiple is above the stored value and not above total_shares.
    // On firing, auto_featured_until = max(existing, now + duration) and a
    // featuring_events row is appended.
    std::optional<FeaturingOutcome> applyFeaturingTrigger(const QString& siteId,
                                                          int shareMultiple,
                                                          int durationHours,
                                                          qint64 now,
                                                          EngineError* error = nullptr);

    std::vector<FeaturingEvent> featuringEventsForSite(const QString& siteId);

    // ── Referrals ───────────────────────────────────────────

    // Fails with DuplicateConversion while a non-churned edge exists for
    // the pair. Both users are created on first sight.
    std::optional<ReferralEdge> insertReferralEdge(const QString& referrerId,
                                                   const QString& refereeId,
                                                   qint64 convertedAt,
                                                   ReferralStatus status,
                                                   qint64 now,
                                                   EngineError* error = nullptr);

    // pending -> active, pending -> churned, active -> churned.
    std::optional<ReferralEdge> updateReferralStatus(int64_t edgeId, ReferralStatus status,
                                                     qint64 now, EngineError* error = nullptr);

    std::optional<ReferralEdge> getReferralEdge(int64_t edgeId, EngineError* error = nullptr);
    std::vector<ReferralEdge> referralEdgesForReferrer(const QString& referrerId);
    std::optional<int> countActiveReferrals(const QString& referrerId, EngineError* error = nullptr);

    // ── Milestones ──────────────────────────────────────────

    struct MilestoneReward {
        QString milestoneType;
        int referralThreshold = 0;
        int rewardMonths = 0;
    };

    struct MilestoneOutcome {
        bool granted = false;
        int activeReferrals = 0;
        std::optional<qint64> proExpiresAt;
    };

    // Count the user's active edges and, at or above the threshold, append
    // the milestone with a conditional insert. Only the caller whose insert
    // lands applies the reward, inside the same transaction.
    std::optional<MilestoneOutcome> grantMilestoneIfQualified(const QString& userId,
                                                              const MilestoneReward& reward,
                                                              qint64 now,
                                                              EngineError* error = nullptr);

    std::vector<MilestoneRecord> milestonesForUser(const QString& userId);

    // ── Commission ledger ───────────────────────────────────

    // Append a settlement entry. A second settlement for the same
    // (edge, period) fails with DuplicatePeriod.
    std::optional<CommissionLedgerEntry> appendSettlement(const CommissionLedgerEntry& entry,
                                                          EngineError* error = nullptr);

    // Append the reversing entry for a settlement. At most one per
    // settlement; a repeat fails with DuplicateEvent.
    std::optional<CommissionLedgerEntry> appendReversal(int64_t entryId, qint64 now,
                                                        EngineError* error = nullptr);

    std::optional<CommissionLedgerEntry> getCommissionEntry(int64_t entryId,
                                                            EngineError* error = nullptr);
    std::vector<CommissionLedgerEntry> commissionEntriesForReferrer(const QString& referrerId);

    // Mark the user's unreversed pending settlements of `period` paid and
    // record the claim. Returns the claimed amount; 0 when nothing was
    // pending (no claim recorded). A second claim is DuplicatePeriod.
    std::optional<int64_t> claimPeriod(const QString& userId, const QString& period,
                                       qint64 now, EngineError* error = nullptr);

    int64_t lifetimeClaimed(const QString& userId);

    // ── Showcase ────────────────────────────────────────────

    struct ShowcaseCandidate {
        SiteRecord site;
        std::vector<ShareEvent> events;
        int64_t ownerTotalShares = 0;
    };

    // Eligible live sites with their share events and owner share totals,
    // read from one snapshot using a fixed number of queries.
    std::optional<std::vector<ShowcaseCandidate>> loadShowcaseCandidates(EngineError* error = nullptr);

    // Replace the whole showcase in one transaction.
    bool replaceShowcase(const std::vector<ShowcaseEntry>& entries,
                         const QString& generationId, qint64 generatedAt,
                         EngineError* error = nullptr);

    std::vector<ShowcaseEntry> showcasePage(int limit, int offset);
    int showcaseSize();

    // ── Reconciliation ──────────────────────────────────────

    struct MissedTrigger {
        QString siteId;
        int totalShares = 0;
        int lastTriggeredMultiple = 0;
        Tier ownerTier = Tier::Free;
    };

    // Live sites whose highest reached multiple of `threshold` has not fired.
    // Nullopt when the scan does not run to completion.
    std::optional<std::vector<MissedTrigger>> sitesWithMissedTriggers(int threshold,
                                                                     EngineError* error = nullptr);

    // Referrers with at least `threshold` active edges and no milestone of
    // the given type.
    std::optional<std::vector<QString>> referrersMissingMilestone(int threshold,
                                                                  const QString& milestoneType,
                                                                  EngineError* error = nullptr);

    // Downgrade users whose pro tier expired at or before `now`.
    // Returns the number of users downgraded.
    std::optional<int> expireProTiers(qint64 now, EngineError* error = nullptr);

    // ── Settings / maintenance ──────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    bool integrityCheck() const;

    sqlite3* rawDb() const { return m_db; }

private:
    LedgerStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    // Map a failed sqlite3_step()/exec result onto the engine taxonomy.
    void reportFailure(int rc, const char* operation, EngineErrorCode uniqueCode,
                       EngineError* error);

    bool refreshEligibility(const QString& ownerId, EngineError* error);
    std::optional<Tier> tierOf(const QString& userId);
    bool ensureUser(const QString& userId, Tier tier, qint64 now, EngineError* error);
    bool loadPlatformShares(SiteRecord& site);

    // Featuring swap and log row; the caller holds the write transaction.
    std::optional<bool> fireFeaturingLocked(const QString& siteId, int shareMultiple,
                                            int durationHours, qint64 now,
                                            const char* operation, EngineError* error);

    sqlite3* m_db = nullptr;
};

} // namespace ge
