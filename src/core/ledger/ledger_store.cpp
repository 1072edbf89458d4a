#include "core/ledger/ledger_store.h"
#include "core/ledger/migration.h"
#include "core/ledger/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>

#include <algorithm>
#include <cstring>
#include <type_traits>
#include <unordered_map>

namespace ge {

namespace {

constexpr qint64 kSecondsPerHour = 3600;

// Finalizes the wrapped statement when it leaves scope.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
    {
        m_rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_rc == SQLITE_OK; }
    int prepareResult() const { return m_rc; }
    sqlite3_stmt* get() const { return m_stmt; }

    void bind(int index, const QString& value)
    {
        const QByteArray utf8 = value.toUtf8();
        sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
    }
    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    void bind(int index, Int value)
    {
        sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
    }
    void bind(int index, double value) { sqlite3_bind_double(m_stmt, index, value); }
    void bind(int index, const std::optional<qint64>& value)
    {
        if (value.has_value()) {
            sqlite3_bind_int64(m_stmt, index, *value);
        } else {
            sqlite3_bind_null(m_stmt, index);
        }
    }

    int step() { return sqlite3_step(m_stmt); }
    void reset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    QString text(int col) const
    {
        const char* val = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return val ? QString::fromUtf8(val) : QString();
    }
    int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
    int integer(int col) const { return sqlite3_column_int(m_stmt, col); }
    double real(int col) const { return sqlite3_column_double(m_stmt, col); }
    std::optional<qint64> optionalInt64(int col) const
    {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return sqlite3_column_int64(m_stmt, col);
    }

private:
    sqlite3_stmt* m_stmt = nullptr;
    int m_rc = SQLITE_ERROR;
};

// Rolls back on scope exit unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : m_db(db) {}
    ~Transaction()
    {
        if (m_active) {
            char* errMsg = nullptr;
            if (sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
                LOG_WARN(geLedger, "ROLLBACK failed: %s", errMsg ? errMsg : "unknown");
            }
            sqlite3_free(errMsg);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Write transactions take the database write lock up front so the
    // read-modify-write inside cannot interleave with another writer.
    int beginWrite() { return begin("BEGIN IMMEDIATE"); }
    // Deferred transaction: the first read pins a consistent WAL snapshot.
    int beginRead() { return begin("BEGIN"); }

    int commit()
    {
        const int rc = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) {
            m_active = false;
        }
        return rc;
    }

private:
    int begin(const char* sql)
    {
        const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, nullptr);
        m_active = (rc == SQLITE_OK);
        return rc;
    }

    sqlite3* m_db = nullptr;
    bool m_active = false;
};

constexpr const char* kSiteColumns = R"(
    s.id, s.owner_id, u.tier, s.created_at, s.pageviews, s.total_shares,
    s.last_triggered_multiple, s.auto_featured_until, s.showcase_eligible,
    s.retired_at, s.version
)";

SiteRecord readSite(const Statement& stmt)
{
    SiteRecord site;
    site.id = stmt.text(0);
    site.ownerId = stmt.text(1);
    site.tier = tierFromString(stmt.text(2)).value_or(Tier::Free);
    site.createdAt = stmt.int64(3);
    site.pageviews = stmt.int64(4);
    site.totalShares = stmt.integer(5);
    site.lastTriggeredMultiple = stmt.integer(6);
    site.autoFeaturedUntil = stmt.optionalInt64(7);
    site.showcaseEligible = stmt.integer(8) != 0;
    site.retiredAt = stmt.optionalInt64(9);
    site.version = stmt.int64(10);
    return site;
}

ReferralEdge readEdge(const Statement& stmt)
{
    ReferralEdge edge;
    edge.id = stmt.int64(0);
    edge.referrerId = stmt.text(1);
    edge.refereeId = stmt.text(2);
    edge.convertedAt = stmt.int64(3);
    edge.status = referralStatusFromString(stmt.text(4)).value_or(ReferralStatus::Pending);
    return edge;
}

constexpr const char* kEntryColumns = R"(
    c.id, c.edge_id, c.period, c.period_start, c.period_end, c.kind,
    c.reverses_entry_id, c.rate_bps, c.base_amount, c.payable_amount,
    c.settlement_status, c.created_at
)";

CommissionLedgerEntry readEntry(const Statement& stmt)
{
    CommissionLedgerEntry entry;
    entry.id = stmt.int64(0);
    entry.edgeId = stmt.int64(1);
    entry.period = stmt.text(2);
    entry.periodStart = stmt.int64(3);
    entry.periodEnd = stmt.int64(4);
    entry.kind = entryKindFromString(stmt.text(5));
    entry.reversesEntryId = stmt.optionalInt64(6).value_or(0);
    entry.rateBps = stmt.integer(7);
    entry.baseAmount = stmt.int64(8);
    entry.payableAmount = stmt.int64(9);
    entry.settlementStatus = settlementStatusFromString(stmt.text(10));
    entry.createdAt = stmt.int64(11);
    return entry;
}

bool isAllowedTransition(ReferralStatus from, ReferralStatus to)
{
    switch (from) {
    case ReferralStatus::Pending:
        return to == ReferralStatus::Active || to == ReferralStatus::Churned;
    case ReferralStatus::Active:
        return to == ReferralStatus::Churned;
    case ReferralStatus::Churned:
        return false;
    }
    return false;
}

std::string joinSql(const char* head, const char* columns, const char* tail)
{
    std::string sql(head);
    sql += columns;
    sql += tail;
    return sql;
}

} // namespace

LedgerStore::~LedgerStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<LedgerStore> LedgerStore::open(const QString& dbPath)
{
    LedgerStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool LedgerStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(geLedger, "Failed to open ledger: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(geLedger, "Failed to set connection pragmas");
        return false;
    }

    // Skip schema creation when another connection already created it so a
    // second opener never contends for the write lock on startup.
    bool schemaExists = false;
    {
        Statement stmt(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='sites'");
        if (stmt.ok() && stmt.step() == SQLITE_ROW) {
            schemaExists = stmt.integer(0) > 0;
        }
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(geLedger, "Failed to set database pragmas");
            return false;
        }

        {
            Statement stmt(m_db, "PRAGMA journal_mode");
            if (stmt.ok() && stmt.step() == SQLITE_ROW) {
                const QString mode = stmt.text(0);
                if (mode != QLatin1String("wal")) {
                    LOG_WARN(geLedger, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
        }

        if (!execSql("BEGIN IMMEDIATE")) {
            return false;
        }
        if (!execSql(kSchemaV1) || !execSql(kDefaultSettings)) {
            LOG_ERROR(geLedger, "Failed to create schema");
            execSql("ROLLBACK");
            return false;
        }
        if (!execSql("COMMIT")) {
            execSql("ROLLBACK");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(geLedger, "Migration failed");
        return false;
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(geLedger, "Ledger opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool LedgerStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(geLedger, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void LedgerStore::reportFailure(int rc, const char* operation, EngineErrorCode uniqueCode,
                                EngineError* error)
{
    const int extended = sqlite3_extended_errcode(m_db);
    const int primary = rc & 0xff;
    const QString detail = QString::fromUtf8(sqlite3_errmsg(m_db));

    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        LOG_WARN(geLedger, "%s: ledger busy (%s)", operation, qUtf8Printable(detail));
        setError(error, EngineErrorCode::TransientStoreError,
                 QStringLiteral("%1: ledger busy").arg(QLatin1String(operation)));
        return;
    }
    if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        LOG_DEBUG(geLedger, "%s: uniqueness guard hit (%s)", operation, qUtf8Printable(detail));
        setError(error, uniqueCode, QStringLiteral("%1: already recorded").arg(QLatin1String(operation)));
        return;
    }
    if (extended == SQLITE_CONSTRAINT_CHECK) {
        LOG_ERROR(geLedger, "%s: CHECK constraint violated (%s)", operation, qUtf8Printable(detail));
        setError(error, EngineErrorCode::InvariantViolation,
                 QStringLiteral("%1: %2").arg(QLatin1String(operation), detail));
        return;
    }
    if (primary == SQLITE_IOERR || primary == SQLITE_FULL || primary == SQLITE_PROTOCOL) {
        LOG_WARN(geLedger, "%s: I/O failure (%s)", operation, qUtf8Printable(detail));
        setError(error, EngineErrorCode::TransientStoreError,
                 QStringLiteral("%1: %2").arg(QLatin1String(operation), detail));
        return;
    }

    LOG_ERROR(geLedger, "%s failed (rc=%d): %s", operation, extended, qUtf8Printable(detail));
    setError(error, EngineErrorCode::InvariantViolation,
             QStringLiteral("%1: %2").arg(QLatin1String(operation), detail));
}

// ── Users and sites ─────────────────────────────────────────

bool LedgerStore::ensureUser(const QString& userId, Tier tier, qint64 now, EngineError* error)
{
    Statement stmt(m_db, R"(
        INSERT OR IGNORE INTO users (id, tier, pro_expires_at, created_at, updated_at)
        VALUES (?1, ?2, NULL, ?3, ?3)
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "ensureUser", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    stmt.bind(1, userId);
    stmt.bind(2, tierToString(tier));
    stmt.bind(3, static_cast<int64_t>(now));
    const int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "ensureUser", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    if (sqlite3_changes(m_db) > 0 && tier == Tier::Pro) {
        Statement history(m_db, R"(
            INSERT INTO subscription_history (user_id, tier, source, started_at, expires_at)
            VALUES (?1, 'pro', 'registration', ?2, NULL)
        )");
        history.bind(1, userId);
        history.bind(2, static_cast<int64_t>(now));
        const int historyRc = history.ok() ? history.step() : history.prepareResult();
        if (historyRc != SQLITE_DONE) {
            reportFailure(historyRc, "ensureUser history", EngineErrorCode::InvariantViolation, error);
            return false;
        }
    }
    return true;
}

std::optional<Tier> LedgerStore::tierOf(const QString& userId)
{
    Statement stmt(m_db, "SELECT tier FROM users WHERE id = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind(1, userId);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return tierFromString(stmt.text(0));
}

bool LedgerStore::refreshEligibility(const QString& ownerId, EngineError* error)
{
    Statement stmt(m_db, R"(
        UPDATE sites
        SET showcase_eligible = (SELECT CASE WHEN tier = 'pro' THEN 1 ELSE 0 END
                                 FROM users WHERE id = ?1),
            version = version + 1
        WHERE owner_id = ?1
          AND retired_at IS NULL
          AND showcase_eligible != (SELECT CASE WHEN tier = 'pro' THEN 1 ELSE 0 END
                                    FROM users WHERE id = ?1)
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "refreshEligibility", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    stmt.bind(1, ownerId);
    const int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "refreshEligibility", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    return true;
}

std::optional<UserRecord> LedgerStore::getUser(const QString& userId)
{
    Statement stmt(m_db, "SELECT id, tier, pro_expires_at, created_at FROM users WHERE id = ?1");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "getUser prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    stmt.bind(1, userId);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    UserRecord user;
    user.id = stmt.text(0);
    user.tier = tierFromString(stmt.text(1)).value_or(Tier::Free);
    user.proExpiresAt = stmt.optionalInt64(2);
    user.createdAt = stmt.int64(3);
    return user;
}

bool LedgerStore::setUserTier(const QString& userId, Tier tier,
                              std::optional<qint64> proExpiresAt,
                              const QString& source, qint64 now,
                              EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "setUserTier", EngineErrorCode::InvariantViolation, error);
        return false;
    }

    if (tier == Tier::Free) {
        proExpiresAt.reset();
    }

    {
        Statement stmt(m_db, R"(
            UPDATE users SET tier = ?2, pro_expires_at = ?3, updated_at = ?4 WHERE id = ?1
        )");
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "setUserTier", EngineErrorCode::InvariantViolation, error);
            return false;
        }
        stmt.bind(1, userId);
        stmt.bind(2, tierToString(tier));
        stmt.bind(3, proExpiresAt);
        stmt.bind(4, static_cast<int64_t>(now));
        rc = stmt.step();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "setUserTier", EngineErrorCode::InvariantViolation, error);
            return false;
        }
        if (sqlite3_changes(m_db) == 0) {
            setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown user: %1").arg(userId));
            return false;
        }
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO subscription_history (user_id, tier, source, started_at, expires_at)
            VALUES (?1, ?2, ?3, ?4, ?5)
        )");
        stmt.bind(1, userId);
        stmt.bind(2, tierToString(tier));
        stmt.bind(3, source);
        stmt.bind(4, static_cast<int64_t>(now));
        stmt.bind(5, proExpiresAt);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "setUserTier history", EngineErrorCode::InvariantViolation, error);
            return false;
        }
    }

    if (!refreshEligibility(userId, error)) {
        return false;
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "setUserTier commit", EngineErrorCode::InvariantViolation, error);
        return false;
    }

    LOG_INFO(geLedger, "User %s tier -> %s (%s)", qUtf8Printable(userId),
             qUtf8Printable(tierToString(tier)), qUtf8Printable(source));
    return true;
}

std::optional<SiteRecord> LedgerStore::registerSite(const QString& siteId, const QString& ownerId,
                                                    Tier ownerTier, qint64 createdAt,
                                                    bool* created, EngineError* error)
{
    if (created) {
        *created = false;
    }

    {
        Transaction txn(m_db);
        int rc = txn.beginWrite();
        if (rc != SQLITE_OK) {
            reportFailure(rc, "registerSite", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }

        if (!ensureUser(ownerId, ownerTier, createdAt, error)) {
            return std::nullopt;
        }

        std::optional<QString> existingOwner;
        {
            Statement stmt(m_db, "SELECT owner_id FROM sites WHERE id = ?1");
            stmt.bind(1, siteId);
            if (stmt.ok() && stmt.step() == SQLITE_ROW) {
                existingOwner = stmt.text(0);
            }
        }

        if (existingOwner.has_value()) {
            if (*existingOwner != ownerId) {
                setError(error, EngineErrorCode::InvalidArgument,
                         QStringLiteral("Site %1 is owned by another user").arg(siteId));
                return std::nullopt;
            }
            LOG_DEBUG(geLedger, "registerSite: %s already registered", qUtf8Printable(siteId));
        } else {
            const bool eligible = tierOf(ownerId).value_or(Tier::Free) == Tier::Pro;
            Statement stmt(m_db, R"(
                INSERT INTO sites (id, owner_id, created_at, showcase_eligible)
                VALUES (?1, ?2, ?3, ?4)
            )");
            stmt.bind(1, siteId);
            stmt.bind(2, ownerId);
            stmt.bind(3, static_cast<int64_t>(createdAt));
            stmt.bind(4, eligible ? 1 : 0);
            rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
            if (rc != SQLITE_DONE) {
                reportFailure(rc, "registerSite", EngineErrorCode::DuplicateEvent, error);
                return std::nullopt;
            }
            if (created) {
                *created = true;
            }
        }

        rc = txn.commit();
        if (rc != SQLITE_OK) {
            reportFailure(rc, "registerSite commit", EngineErrorCode::InvariantViolation, error);
            if (created) {
                *created = false;
            }
            return std::nullopt;
        }
    }

    return getSite(siteId, error);
}

bool LedgerStore::retireSite(const QString& siteId, qint64 now, EngineError* error)
{
    Statement stmt(m_db, R"(
        UPDATE sites SET retired_at = COALESCE(retired_at, ?2),
                         showcase_eligible = 0,
                         version = version + 1
        WHERE id = ?1
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "retireSite", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    stmt.bind(1, siteId);
    stmt.bind(2, static_cast<int64_t>(now));
    const int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "retireSite", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown site: %1").arg(siteId));
        return false;
    }
    return true;
}

bool LedgerStore::loadPlatformShares(SiteRecord& site)
{
    Statement stmt(m_db,
        "SELECT platform, share_count FROM site_platform_shares WHERE site_id = ?1");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "loadPlatformShares prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    stmt.bind(1, site.id);
    while (stmt.step() == SQLITE_ROW) {
        const std::optional<Platform> platform = platformFromString(stmt.text(0));
        if (platform.has_value()) {
            site.platformShares[*platform] = stmt.integer(1);
        }
    }
    return true;
}

std::optional<SiteRecord> LedgerStore::getSite(const QString& siteId, EngineError* error)
{
    const std::string sql = joinSql("SELECT", kSiteColumns,
        " FROM sites s JOIN users u ON u.id = s.owner_id WHERE s.id = ?1");
    Statement stmt(m_db, sql.c_str());
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "getSite", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, siteId);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown site: %1").arg(siteId));
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        reportFailure(rc, "getSite", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    SiteRecord site = readSite(stmt);
    if (!loadPlatformShares(site)) {
        setError(error, EngineErrorCode::TransientStoreError,
                 QStringLiteral("Failed to load platform shares for %1").arg(siteId));
        return std::nullopt;
    }
    return site;
}

bool LedgerStore::addPageviews(const QString& siteId, int64_t count, EngineError* error)
{
    Statement stmt(m_db, R"(
        UPDATE sites SET pageviews = pageviews + ?2, version = version + 1
        WHERE id = ?1 AND retired_at IS NULL
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "addPageviews", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    stmt.bind(1, siteId);
    stmt.bind(2, count);
    const int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "addPageviews", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        setError(error, EngineErrorCode::NotFound,
                 QStringLiteral("Unknown or retired site: %1").arg(siteId));
        return false;
    }
    return true;
}

// ── Share ledger ────────────────────────────────────────────

std::optional<LedgerStore::ShareAppendResult> LedgerStore::appendShareEvent(
    const ShareEvent& event, qint64 recordedAt, EngineError* error)
{
    return appendShareEvent(event, recordedAt, FeaturingPolicy{}, error);
}

std::optional<LedgerStore::ShareAppendResult> LedgerStore::appendShareEvent(
    const ShareEvent& event, qint64 recordedAt, const FeaturingPolicy& featuring,
    EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "appendShareEvent", EngineErrorCode::DuplicateEvent, error);
        return std::nullopt;
    }

    ShareAppendResult result;

    // A known key is answered from the site it was first recorded against.
    {
        Statement stmt(m_db, R"(
            SELECT s.id, s.total_shares, s.last_triggered_multiple
            FROM share_events e JOIN sites s ON s.id = e.site_id
            WHERE e.idempotency_key = ?1
        )");
        stmt.bind(1, event.idempotencyKey);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc == SQLITE_ROW) {
            result.accepted = false;
            result.siteId = stmt.text(0);
            result.totalShares = stmt.integer(1);
            result.lastTriggeredMultiple = stmt.integer(2);
            LOG_DEBUG(geLedger, "Duplicate share key %s for site %s",
                      qUtf8Printable(event.idempotencyKey), qUtf8Printable(result.siteId));
            return result;
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "appendShareEvent lookup", EngineErrorCode::DuplicateEvent, error);
            return std::nullopt;
        }
    }

    {
        Statement stmt(m_db, "SELECT retired_at FROM sites WHERE id = ?1");
        stmt.bind(1, event.siteId);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc == SQLITE_DONE) {
            setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown site: %1").arg(event.siteId));
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            reportFailure(rc, "appendShareEvent site", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        if (stmt.optionalInt64(0).has_value()) {
            setError(error, EngineErrorCode::NotFound, QStringLiteral("Site is retired: %1").arg(event.siteId));
            return std::nullopt;
        }
    }

    const QString platform = platformToString(event.platform);
    {
        Statement stmt(m_db, R"(
            INSERT INTO share_events (idempotency_key, site_id, platform, occurred_at, recorded_at)
            VALUES (?1, ?2, ?3, ?4, ?5)
        )");
        stmt.bind(1, event.idempotencyKey);
        stmt.bind(2, event.siteId);
        stmt.bind(3, platform);
        stmt.bind(4, static_cast<int64_t>(event.occurredAt));
        stmt.bind(5, static_cast<int64_t>(recordedAt));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "appendShareEvent insert", EngineErrorCode::DuplicateEvent, error);
            return std::nullopt;
        }
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO site_platform_shares (site_id, platform, share_count) VALUES (?1, ?2, 1)
            ON CONFLICT(site_id, platform) DO UPDATE SET share_count = share_count + 1
        )");
        stmt.bind(1, event.siteId);
        stmt.bind(2, platform);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "appendShareEvent platform", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    {
        Statement stmt(m_db, R"(
            UPDATE sites SET total_shares = total_shares + 1, version = version + 1
            WHERE id = ?1
        )");
        stmt.bind(1, event.siteId);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "appendShareEvent counter", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    // Read back under the same write lock: this caller owns exactly this count.
    Tier ownerTier = Tier::Free;
    {
        Statement stmt(m_db, R"(
            SELECT s.total_shares, u.tier
            FROM sites s JOIN users u ON u.id = s.owner_id WHERE s.id = ?1
        )");
        stmt.bind(1, event.siteId);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_ROW) {
            reportFailure(rc, "appendShareEvent counter", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        result.accepted = true;
        result.siteId = event.siteId;
        result.totalShares = stmt.integer(0);
        ownerTier = tierFromString(stmt.text(1)).value_or(Tier::Free);
    }

    if (featuring.shareThreshold > 0 && result.totalShares % featuring.shareThreshold == 0) {
        const int durationHours = ownerTier == Tier::Pro ? featuring.proDurationHours
                                                         : featuring.freeDurationHours;
        const std::optional<bool> fired = fireFeaturingLocked(
            event.siteId, result.totalShares, durationHours, recordedAt,
            "appendShareEvent featuring", error);
        if (!fired.has_value()) {
            return std::nullopt;
        }
        result.featuringFired = *fired;
        result.featuringDurationHours = durationHours;
    }

    {
        Statement stmt(m_db,
            "SELECT last_triggered_multiple, auto_featured_until FROM sites WHERE id = ?1");
        stmt.bind(1, event.siteId);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_ROW) {
            reportFailure(rc, "appendShareEvent read", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        result.lastTriggeredMultiple = stmt.integer(0);
        result.featuredUntil = stmt.optionalInt64(1);
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "appendShareEvent commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return result;
}

std::vector<ShareEvent> LedgerStore::shareEventsForSite(const QString& siteId)
{
    std::vector<ShareEvent> events;
    Statement stmt(m_db, R"(
        SELECT site_id, platform, idempotency_key, occurred_at
        FROM share_events WHERE site_id = ?1 ORDER BY id
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "shareEventsForSite prepare failed: %s", sqlite3_errmsg(m_db));
        return events;
    }
    stmt.bind(1, siteId);
    while (stmt.step() == SQLITE_ROW) {
        ShareEvent event;
        event.siteId = stmt.text(0);
        event.platform = platformFromString(stmt.text(1)).value_or(Platform::Other);
        event.idempotencyKey = stmt.text(2);
        event.occurredAt = stmt.int64(3);
        events.push_back(std::move(event));
    }
    return events;
}

// ── Featuring ───────────────────────────────────────────────

std::optional<bool> LedgerStore::fireFeaturingLocked(const QString& siteId, int shareMultiple,
                                                     int durationHours, qint64 now,
                                                     const char* operation, EngineError* error)
{
    const qint64 windowEnd = now + static_cast<qint64>(durationHours) * kSecondsPerHour;
    int rc = SQLITE_OK;

    {
        Statement stmt(m_db, R"(
            UPDATE sites
            SET last_triggered_multiple = ?2,
                auto_featured_until = MAX(COALESCE(auto_featured_until, ?3), ?3),
                version = version + 1
            WHERE id = ?1
              AND retired_at IS NULL
              AND last_triggered_multiple < ?2
              AND total_shares >= ?2
        )");
        stmt.bind(1, siteId);
        stmt.bind(2, shareMultiple);
        stmt.bind(3, static_cast<int64_t>(windowEnd));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, operation, EngineErrorCode::DuplicateEvent, error);
            return std::nullopt;
        }
        if (sqlite3_changes(m_db) != 1) {
            return false;
        }
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO featuring_events (site_id, share_multiple, duration_hours,
                                          featured_from, featured_until, created_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?4)
        )");
        stmt.bind(1, siteId);
        stmt.bind(2, shareMultiple);
        stmt.bind(3, durationHours);
        stmt.bind(4, static_cast<int64_t>(now));
        stmt.bind(5, static_cast<int64_t>(windowEnd));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, operation, EngineErrorCode::DuplicateEvent, error);
            return std::nullopt;
        }
    }
    return true;
}

std::optional<LedgerStore::FeaturingOutcome> LedgerStore::applyFeaturingTrigger(
    const QString& siteId, int shareMultiple, int durationHours, qint64 now, EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "applyFeaturingTrigger", EngineErrorCode::DuplicateEvent, error);
        return std::nullopt;
    }

    FeaturingOutcome outcome;
    const std::optional<bool> fired =
        fireFeaturingLocked(siteId, shareMultiple, durationHours, now, "applyFeaturingTrigger", error);
    if (!fired.has_value()) {
        return std::nullopt;
    }
    outcome.fired = *fired;

    {
        Statement stmt(m_db,
            "SELECT last_triggered_multiple, auto_featured_until FROM sites WHERE id = ?1");
        stmt.bind(1, siteId);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc == SQLITE_DONE) {
            setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown site: %1").arg(siteId));
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            reportFailure(rc, "applyFeaturingTrigger read", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        outcome.lastTriggeredMultiple = stmt.integer(0);
        outcome.featuredUntil = stmt.optionalInt64(1);
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "applyFeaturingTrigger commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return outcome;
}

std::vector<FeaturingEvent> LedgerStore::featuringEventsForSite(const QString& siteId)
{
    std::vector<FeaturingEvent> events;
    Statement stmt(m_db, R"(
        SELECT site_id, share_multiple, duration_hours, featured_from, featured_until
        FROM featuring_events WHERE site_id = ?1 ORDER BY share_multiple
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "featuringEventsForSite prepare failed: %s", sqlite3_errmsg(m_db));
        return events;
    }
    stmt.bind(1, siteId);
    while (stmt.step() == SQLITE_ROW) {
        FeaturingEvent event;
        event.siteId = stmt.text(0);
        event.shareMultiple = stmt.integer(1);
        event.durationHours = stmt.integer(2);
        event.featuredFrom = stmt.int64(3);
        event.featuredUntil = stmt.int64(4);
        events.push_back(std::move(event));
    }
    return events;
}

// ── Referrals ───────────────────────────────────────────────

std::optional<ReferralEdge> LedgerStore::insertReferralEdge(const QString& referrerId,
                                                            const QString& refereeId,
                                                            qint64 convertedAt,
                                                            ReferralStatus status,
                                                            qint64 now,
                                                            EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "insertReferralEdge", EngineErrorCode::DuplicateConversion, error);
        return std::nullopt;
    }

    if (!ensureUser(referrerId, Tier::Free, now, error)
        || !ensureUser(refereeId, Tier::Free, now, error)) {
        return std::nullopt;
    }

    ReferralEdge edge;
    {
        Statement stmt(m_db, R"(
            INSERT INTO referral_edges (referrer_id, referee_id, converted_at, status, updated_at)
            VALUES (?1, ?2, ?3, ?4, ?5)
        )");
        stmt.bind(1, referrerId);
        stmt.bind(2, refereeId);
        stmt.bind(3, static_cast<int64_t>(convertedAt));
        stmt.bind(4, referralStatusToString(status));
        stmt.bind(5, static_cast<int64_t>(now));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "insertReferralEdge", EngineErrorCode::DuplicateConversion, error);
            return std::nullopt;
        }
        edge.id = sqlite3_last_insert_rowid(m_db);
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "insertReferralEdge commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    edge.referrerId = referrerId;
    edge.refereeId = refereeId;
    edge.convertedAt = convertedAt;
    edge.status = status;
    return edge;
}

std::optional<ReferralEdge> LedgerStore::updateReferralStatus(int64_t edgeId, ReferralStatus status,
                                                              qint64 now, EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "updateReferralStatus", EngineErrorCode::DuplicateConversion, error);
        return std::nullopt;
    }

    std::optional<ReferralEdge> edge = getReferralEdge(edgeId, error);
    if (!edge.has_value()) {
        return std::nullopt;
    }

    if (edge->status == status) {
        return edge;
    }
    if (!isAllowedTransition(edge->status, status)) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Referral %1 cannot move from %2 to %3")
                     .arg(edgeId)
                     .arg(referralStatusToString(edge->status), referralStatusToString(status)));
        return std::nullopt;
    }

    {
        Statement stmt(m_db, "UPDATE referral_edges SET status = ?2, updated_at = ?3 WHERE id = ?1");
        stmt.bind(1, edgeId);
        stmt.bind(2, referralStatusToString(status));
        stmt.bind(3, static_cast<int64_t>(now));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "updateReferralStatus", EngineErrorCode::DuplicateConversion, error);
            return std::nullopt;
        }
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "updateReferralStatus commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    edge->status = status;
    return edge;
}

std::optional<ReferralEdge> LedgerStore::getReferralEdge(int64_t edgeId, EngineError* error)
{
    Statement stmt(m_db, R"(
        SELECT id, referrer_id, referee_id, converted_at, status
        FROM referral_edges WHERE id = ?1
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "getReferralEdge", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, edgeId);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        setError(error, EngineErrorCode::NotFound, QStringLiteral("Unknown referral: %1").arg(edgeId));
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        reportFailure(rc, "getReferralEdge", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return readEdge(stmt);
}

std::vector<ReferralEdge> LedgerStore::referralEdgesForReferrer(const QString& referrerId)
{
    std::vector<ReferralEdge> edges;
    Statement stmt(m_db, R"(
        SELECT id, referrer_id, referee_id, converted_at, status
        FROM referral_edges WHERE referrer_id = ?1 ORDER BY converted_at, id
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "referralEdgesForReferrer prepare failed: %s", sqlite3_errmsg(m_db));
        return edges;
    }
    stmt.bind(1, referrerId);
    while (stmt.step() == SQLITE_ROW) {
        edges.push_back(readEdge(stmt));
    }
    return edges;
}

std::optional<int> LedgerStore::countActiveReferrals(const QString& referrerId, EngineError* error)
{
    Statement stmt(m_db,
        "SELECT COUNT(*) FROM referral_edges WHERE referrer_id = ?1 AND status = 'active'");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "countActiveReferrals", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, referrerId);
    const int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        reportFailure(rc, "countActiveReferrals", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return stmt.integer(0);
}

// ── Milestones ──────────────────────────────────────────────

std::optional<LedgerStore::MilestoneOutcome> LedgerStore::grantMilestoneIfQualified(
    const QString& userId, const MilestoneReward& reward, qint64 now, EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "grantMilestone", EngineErrorCode::DuplicateEvent, error);
        return std::nullopt;
    }

    MilestoneOutcome outcome;
    const std::optional<int> active = countActiveReferrals(userId, error);
    if (!active.has_value()) {
        return std::nullopt;
    }
    outcome.activeReferrals = *active;

    if (outcome.activeReferrals >= reward.referralThreshold) {
        {
            Statement stmt(m_db, R"(
                INSERT OR IGNORE INTO milestones (user_id, milestone_type, fired_at)
                VALUES (?1, ?2, ?3)
            )");
            stmt.bind(1, userId);
            stmt.bind(2, reward.milestoneType);
            stmt.bind(3, static_cast<int64_t>(now));
            rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
            if (rc != SQLITE_DONE) {
                reportFailure(rc, "grantMilestone", EngineErrorCode::DuplicateEvent, error);
                return std::nullopt;
            }
            outcome.granted = sqlite3_changes(m_db) == 1;
        }

        if (outcome.granted) {
            const std::optional<UserRecord> user = getUser(userId);
            if (!user.has_value()) {
                setError(error, EngineErrorCode::InvariantViolation,
                         QStringLiteral("Referrer %1 has edges but no user row").arg(userId));
                LOG_ERROR(geLedger, "Referrer %s has edges but no user row", qUtf8Printable(userId));
                return std::nullopt;
            }

            const qint64 rewardEnd = QDateTime::fromSecsSinceEpoch(now, Qt::UTC)
                                         .addMonths(reward.rewardMonths)
                                         .toSecsSinceEpoch();
            // A paid pro subscription without expiry already outlasts the reward.
            const bool openEndedPro = user->tier == Tier::Pro && !user->proExpiresAt.has_value();
            if (!openEndedPro) {
                outcome.proExpiresAt = std::max(user->proExpiresAt.value_or(0), rewardEnd);
            }

            {
                Statement stmt(m_db, R"(
                    UPDATE users SET tier = 'pro', pro_expires_at = ?2, updated_at = ?3 WHERE id = ?1
                )");
                stmt.bind(1, userId);
                stmt.bind(2, outcome.proExpiresAt);
                stmt.bind(3, static_cast<int64_t>(now));
                rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
                if (rc != SQLITE_DONE) {
                    reportFailure(rc, "grantMilestone reward", EngineErrorCode::InvariantViolation, error);
                    return std::nullopt;
                }
            }
            {
                Statement stmt(m_db, R"(
                    INSERT INTO subscription_history (user_id, tier, source, started_at, expires_at)
                    VALUES (?1, 'pro', ?2, ?3, ?4)
                )");
                stmt.bind(1, userId);
                stmt.bind(2, QStringLiteral("milestone:%1").arg(reward.milestoneType));
                stmt.bind(3, static_cast<int64_t>(now));
                stmt.bind(4, outcome.proExpiresAt);
                rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
                if (rc != SQLITE_DONE) {
                    reportFailure(rc, "grantMilestone history", EngineErrorCode::InvariantViolation, error);
                    return std::nullopt;
                }
            }
            if (!refreshEligibility(userId, error)) {
                return std::nullopt;
            }
        }
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "grantMilestone commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return outcome;
}

std::vector<MilestoneRecord> LedgerStore::milestonesForUser(const QString& userId)
{
    std::vector<MilestoneRecord> records;
    Statement stmt(m_db, R"(
        SELECT user_id, milestone_type, fired_at FROM milestones
        WHERE user_id = ?1 ORDER BY fired_at, id
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "milestonesForUser prepare failed: %s", sqlite3_errmsg(m_db));
        return records;
    }
    stmt.bind(1, userId);
    while (stmt.step() == SQLITE_ROW) {
        MilestoneRecord record;
        record.userId = stmt.text(0);
        record.milestoneType = stmt.text(1);
        record.firedAt = stmt.int64(2);
        records.push_back(std::move(record));
    }
    return records;
}

// ── Commission ledger ───────────────────────────────────────

std::optional<CommissionLedgerEntry> LedgerStore::appendSettlement(const CommissionLedgerEntry& entry,
                                                                   EngineError* error)
{
    Statement stmt(m_db, R"(
        INSERT INTO commission_entries (edge_id, period, period_start, period_end, kind,
                                        reverses_entry_id, rate_bps, base_amount,
                                        payable_amount, settlement_status, created_at)
        VALUES (?1, ?2, ?3, ?4, 'settlement', NULL, ?5, ?6, ?7, 'pending', ?8)
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "appendSettlement", EngineErrorCode::DuplicatePeriod, error);
        return std::nullopt;
    }
    stmt.bind(1, entry.edgeId);
    stmt.bind(2, entry.period);
    stmt.bind(3, static_cast<int64_t>(entry.periodStart));
    stmt.bind(4, static_cast<int64_t>(entry.periodEnd));
    stmt.bind(5, entry.rateBps);
    stmt.bind(6, entry.baseAmount);
    stmt.bind(7, entry.payableAmount);
    stmt.bind(8, static_cast<int64_t>(entry.createdAt));
    const int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "appendSettlement", EngineErrorCode::DuplicatePeriod, error);
        return std::nullopt;
    }

    CommissionLedgerEntry stored = entry;
    stored.id = sqlite3_last_insert_rowid(m_db);
    stored.kind = EntryKind::Settlement;
    stored.reversesEntryId = 0;
    stored.settlementStatus = SettlementStatus::Pending;
    return stored;
}

std::optional<CommissionLedgerEntry> LedgerStore::appendReversal(int64_t entryId, qint64 now,
                                                                 EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "appendReversal", EngineErrorCode::DuplicateEvent, error);
        return std::nullopt;
    }

    std::optional<CommissionLedgerEntry> original = getCommissionEntry(entryId, error);
    if (!original.has_value()) {
        return std::nullopt;
    }
    if (original->kind != EntryKind::Settlement) {
        setError(error, EngineErrorCode::InvalidArgument,
                 QStringLiteral("Entry %1 is a reversal and cannot be reversed").arg(entryId));
        return std::nullopt;
    }

    CommissionLedgerEntry reversal = *original;
    reversal.kind = EntryKind::Reversal;
    reversal.reversesEntryId = entryId;
    reversal.settlementStatus = SettlementStatus::Pending;
    reversal.createdAt = now;

    {
        Statement stmt(m_db, R"(
            INSERT INTO commission_entries (edge_id, period, period_start, period_end, kind,
                                            reverses_entry_id, rate_bps, base_amount,
                                            payable_amount, settlement_status, created_at)
            VALUES (?1, ?2, ?3, ?4, 'reversal', ?5, ?6, ?7, ?8, 'pending', ?9)
        )");
        stmt.bind(1, reversal.edgeId);
        stmt.bind(2, reversal.period);
        stmt.bind(3, static_cast<int64_t>(reversal.periodStart));
        stmt.bind(4, static_cast<int64_t>(reversal.periodEnd));
        stmt.bind(5, entryId);
        stmt.bind(6, reversal.rateBps);
        stmt.bind(7, reversal.baseAmount);
        stmt.bind(8, reversal.payableAmount);
        stmt.bind(9, static_cast<int64_t>(now));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "appendReversal", EngineErrorCode::DuplicateEvent, error);
            return std::nullopt;
        }
        reversal.id = sqlite3_last_insert_rowid(m_db);
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "appendReversal commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return reversal;
}

std::optional<CommissionLedgerEntry> LedgerStore::getCommissionEntry(int64_t entryId,
                                                                     EngineError* error)
{
    const std::string sql = joinSql("SELECT", kEntryColumns,
                                    " FROM commission_entries c WHERE c.id = ?1");
    Statement stmt(m_db, sql.c_str());
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "getCommissionEntry", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, entryId);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        setError(error, EngineErrorCode::NotFound,
                 QStringLiteral("Unknown commission entry: %1").arg(entryId));
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        reportFailure(rc, "getCommissionEntry", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return readEntry(stmt);
}

std::vector<CommissionLedgerEntry> LedgerStore::commissionEntriesForReferrer(const QString& referrerId)
{
    std::vector<CommissionLedgerEntry> entries;
    const std::string sql = joinSql("SELECT", kEntryColumns, R"(
        FROM commission_entries c JOIN referral_edges r ON r.id = c.edge_id
        WHERE r.referrer_id = ?1 ORDER BY c.id
    )");
    Statement stmt(m_db, sql.c_str());
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "commissionEntriesForReferrer prepare failed: %s", sqlite3_errmsg(m_db));
        return entries;
    }
    stmt.bind(1, referrerId);
    while (stmt.step() == SQLITE_ROW) {
        entries.push_back(readEntry(stmt));
    }
    return entries;
}

std::optional<int64_t> LedgerStore::claimPeriod(const QString& userId, const QString& period,
                                                qint64 now, EngineError* error)
{
    static constexpr const char* kClaimableFilter = R"(
        FROM commission_entries c JOIN referral_edges r ON r.id = c.edge_id
        WHERE r.referrer_id = ?1
          AND c.period = ?2
          AND c.kind = 'settlement'
          AND c.settlement_status = 'pending'
          AND NOT EXISTS (SELECT 1 FROM commission_entries x WHERE x.reverses_entry_id = c.id)
    )";

    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "claimPeriod", EngineErrorCode::DuplicatePeriod, error);
        return std::nullopt;
    }

    {
        Statement stmt(m_db, "SELECT 1 FROM commission_claims WHERE user_id = ?1 AND period = ?2");
        stmt.bind(1, userId);
        stmt.bind(2, period);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc == SQLITE_ROW) {
            setError(error, EngineErrorCode::DuplicatePeriod,
                     QStringLiteral("Period %1 already claimed").arg(period));
            return std::nullopt;
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "claimPeriod", EngineErrorCode::DuplicatePeriod, error);
            return std::nullopt;
        }
    }

    int64_t amount = 0;
    {
        const std::string sql = std::string("SELECT COALESCE(SUM(c.payable_amount), 0)") + kClaimableFilter;
        Statement stmt(m_db, sql.c_str());
        stmt.bind(1, userId);
        stmt.bind(2, period);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_ROW) {
            reportFailure(rc, "claimPeriod sum", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        amount = stmt.int64(0);
    }

    if (amount == 0) {
        LOG_DEBUG(geCommission, "Nothing to claim for %s in %s",
                  qUtf8Printable(userId), qUtf8Printable(period));
        return int64_t{0};
    }

    {
        const std::string sql =
            std::string("UPDATE commission_entries SET settlement_status = 'paid' WHERE id IN (SELECT c.id")
            + kClaimableFilter + ")";
        Statement stmt(m_db, sql.c_str());
        stmt.bind(1, userId);
        stmt.bind(2, period);
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "claimPeriod mark paid", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO commission_claims (user_id, period, amount, claimed_at)
            VALUES (?1, ?2, ?3, ?4)
        )");
        stmt.bind(1, userId);
        stmt.bind(2, period);
        stmt.bind(3, amount);
        stmt.bind(4, static_cast<int64_t>(now));
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "claimPeriod record", EngineErrorCode::DuplicatePeriod, error);
            return std::nullopt;
        }
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "claimPeriod commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    LOG_INFO(geCommission, "User %s claimed %lld for %s", qUtf8Printable(userId),
             static_cast<long long>(amount), qUtf8Printable(period));
    return amount;
}

int64_t LedgerStore::lifetimeClaimed(const QString& userId)
{
    Statement stmt(m_db, "SELECT COALESCE(SUM(amount), 0) FROM commission_claims WHERE user_id = ?1");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "lifetimeClaimed prepare failed: %s", sqlite3_errmsg(m_db));
        return 0;
    }
    stmt.bind(1, userId);
    return stmt.step() == SQLITE_ROW ? stmt.int64(0) : 0;
}

// ── Showcase ────────────────────────────────────────────────

std::optional<std::vector<LedgerStore::ShowcaseCandidate>> LedgerStore::loadShowcaseCandidates(
    EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginRead();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "loadShowcaseCandidates", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    std::vector<ShowcaseCandidate> candidates;
    std::unordered_map<QString, size_t> indexBySite;

    {
        const std::string sql = joinSql("SELECT", kSiteColumns, R"(
            FROM sites s JOIN users u ON u.id = s.owner_id
            WHERE s.showcase_eligible = 1 AND s.retired_at IS NULL
            ORDER BY s.id
        )");
        Statement stmt(m_db, sql.c_str());
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "loadShowcaseCandidates sites",
                          EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        while ((rc = stmt.step()) == SQLITE_ROW) {
            ShowcaseCandidate candidate;
            candidate.site = readSite(stmt);
            indexBySite.emplace(candidate.site.id, candidates.size());
            candidates.push_back(std::move(candidate));
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "loadShowcaseCandidates sites", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    {
        Statement stmt(m_db, R"(
            SELECT e.site_id, e.platform, e.idempotency_key, e.occurred_at
            FROM share_events e JOIN sites s ON s.id = e.site_id
            WHERE s.showcase_eligible = 1 AND s.retired_at IS NULL
            ORDER BY e.site_id, e.id
        )");
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "loadShowcaseCandidates events",
                          EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        while ((rc = stmt.step()) == SQLITE_ROW) {
            const auto it = indexBySite.find(stmt.text(0));
            if (it == indexBySite.end()) {
                continue;
            }
            ShareEvent event;
            event.siteId = it->first;
            event.platform = platformFromString(stmt.text(1)).value_or(Platform::Other);
            event.idempotencyKey = stmt.text(2);
            event.occurredAt = stmt.int64(3);
            candidates[it->second].events.push_back(std::move(event));
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "loadShowcaseCandidates events", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    {
        std::unordered_map<QString, int64_t> sharesByOwner;
        Statement stmt(m_db, "SELECT owner_id, SUM(total_shares) FROM sites GROUP BY owner_id");
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "loadShowcaseCandidates owners",
                          EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        while ((rc = stmt.step()) == SQLITE_ROW) {
            sharesByOwner[stmt.text(0)] = stmt.int64(1);
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "loadShowcaseCandidates owners", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        for (ShowcaseCandidate& candidate : candidates) {
            const auto it = sharesByOwner.find(candidate.site.ownerId);
            candidate.ownerTotalShares = it != sharesByOwner.end() ? it->second : 0;
        }
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "loadShowcaseCandidates commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return candidates;
}

bool LedgerStore::replaceShowcase(const std::vector<ShowcaseEntry>& entries,
                                  const QString& generationId, qint64 generatedAt,
                                  EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "replaceShowcase", EngineErrorCode::InvariantViolation, error);
        return false;
    }

    {
        Statement stmt(m_db, "DELETE FROM showcase_entries");
        rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "replaceShowcase clear", EngineErrorCode::InvariantViolation, error);
            return false;
        }
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO showcase_entries (rank, site_id, owner_id, score, boost_level,
                                          generation_id, generated_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        )");
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "replaceShowcase insert",
                          EngineErrorCode::InvariantViolation, error);
            return false;
        }
        for (const ShowcaseEntry& entry : entries) {
            stmt.reset();
            stmt.bind(1, entry.rank);
            stmt.bind(2, entry.siteId);
            stmt.bind(3, entry.ownerId);
            stmt.bind(4, entry.score);
            stmt.bind(5, viralBoostLevelToString(entry.boostLevel));
            stmt.bind(6, generationId);
            stmt.bind(7, static_cast<int64_t>(generatedAt));
            rc = stmt.step();
            if (rc != SQLITE_DONE) {
                // Duplicate rank or site means the ranker produced a broken order.
                reportFailure(rc, "replaceShowcase insert", EngineErrorCode::InvariantViolation, error);
                return false;
            }
        }
    }

    if (!setSetting(QStringLiteral("showcaseGeneration"), generationId)
        || !setSetting(QStringLiteral("showcaseGeneratedAt"), QString::number(generatedAt))) {
        setError(error, EngineErrorCode::TransientStoreError,
                 QStringLiteral("Failed to record showcase generation"));
        return false;
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "replaceShowcase commit", EngineErrorCode::InvariantViolation, error);
        return false;
    }
    return true;
}

std::vector<ShowcaseEntry> LedgerStore::showcasePage(int limit, int offset)
{
    std::vector<ShowcaseEntry> entries;
    Statement stmt(m_db, R"(
        SELECT rank, site_id, owner_id, score, boost_level, generation_id, generated_at
        FROM showcase_entries ORDER BY rank LIMIT ?1 OFFSET ?2
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "showcasePage prepare failed: %s", sqlite3_errmsg(m_db));
        return entries;
    }
    stmt.bind(1, limit);
    stmt.bind(2, offset);
    while (stmt.step() == SQLITE_ROW) {
        ShowcaseEntry entry;
        entry.rank = stmt.integer(0);
        entry.siteId = stmt.text(1);
        entry.ownerId = stmt.text(2);
        entry.score = stmt.real(3);
        entry.boostLevel = viralBoostLevelFromString(stmt.text(4));
        entry.generationId = stmt.text(5);
        entry.generatedAt = stmt.int64(6);
        entries.push_back(std::move(entry));
    }
    return entries;
}

int LedgerStore::showcaseSize()
{
    Statement stmt(m_db, "SELECT COUNT(*) FROM showcase_entries");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return 0;
    }
    return stmt.integer(0);
}

// ── Reconciliation ──────────────────────────────────────────

std::optional<std::vector<LedgerStore::MissedTrigger>> LedgerStore::sitesWithMissedTriggers(
    int threshold, EngineError* error)
{
    std::vector<MissedTrigger> missed;
    if (threshold <= 0) {
        return missed;
    }
    Statement stmt(m_db, R"(
        SELECT s.id, s.total_shares, s.last_triggered_multiple, u.tier
        FROM sites s JOIN users u ON u.id = s.owner_id
        WHERE s.retired_at IS NULL
          AND (s.total_shares / ?1) * ?1 > s.last_triggered_multiple
        ORDER BY s.id
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "sitesWithMissedTriggers",
                      EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, threshold);
    int rc = SQLITE_OK;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        MissedTrigger trigger;
        trigger.siteId = stmt.text(0);
        trigger.totalShares = stmt.integer(1);
        trigger.lastTriggeredMultiple = stmt.integer(2);
        trigger.ownerTier = tierFromString(stmt.text(3)).value_or(Tier::Free);
        missed.push_back(std::move(trigger));
    }
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "sitesWithMissedTriggers", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return missed;
}

std::optional<std::vector<QString>> LedgerStore::referrersMissingMilestone(
    int threshold, const QString& milestoneType, EngineError* error)
{
    std::vector<QString> referrers;
    Statement stmt(m_db, R"(
        SELECT r.referrer_id
        FROM referral_edges r
        WHERE r.status = 'active'
          AND NOT EXISTS (SELECT 1 FROM milestones m
                          WHERE m.user_id = r.referrer_id AND m.milestone_type = ?2)
        GROUP BY r.referrer_id
        HAVING COUNT(*) >= ?1
        ORDER BY r.referrer_id
    )");
    if (!stmt.ok()) {
        reportFailure(stmt.prepareResult(), "referrersMissingMilestone",
                      EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    stmt.bind(1, threshold);
    stmt.bind(2, milestoneType);
    int rc = SQLITE_OK;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        referrers.push_back(stmt.text(0));
    }
    if (rc != SQLITE_DONE) {
        reportFailure(rc, "referrersMissingMilestone", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }
    return referrers;
}

std::optional<int> LedgerStore::expireProTiers(qint64 now, EngineError* error)
{
    Transaction txn(m_db);
    int rc = txn.beginWrite();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "expireProTiers", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    std::vector<QString> expired;
    {
        Statement stmt(m_db, R"(
            SELECT id FROM users
            WHERE tier = 'pro' AND pro_expires_at IS NOT NULL AND pro_expires_at <= ?1
            ORDER BY id
        )");
        if (!stmt.ok()) {
            reportFailure(stmt.prepareResult(), "expireProTiers", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
        stmt.bind(1, static_cast<int64_t>(now));
        while ((rc = stmt.step()) == SQLITE_ROW) {
            expired.push_back(stmt.text(0));
        }
        if (rc != SQLITE_DONE) {
            reportFailure(rc, "expireProTiers", EngineErrorCode::InvariantViolation, error);
            return std::nullopt;
        }
    }

    for (const QString& userId : expired) {
        {
            Statement stmt(m_db, R"(
                UPDATE users SET tier = 'free', pro_expires_at = NULL, updated_at = ?2 WHERE id = ?1
            )");
            stmt.bind(1, userId);
            stmt.bind(2, static_cast<int64_t>(now));
            rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
            if (rc != SQLITE_DONE) {
                reportFailure(rc, "expireProTiers downgrade", EngineErrorCode::InvariantViolation, error);
                return std::nullopt;
            }
        }
        {
            Statement stmt(m_db, R"(
                INSERT INTO subscription_history (user_id, tier, source, started_at, expires_at)
                VALUES (?1, 'free', 'expiry', ?2, NULL)
            )");
            stmt.bind(1, userId);
            stmt.bind(2, static_cast<int64_t>(now));
            rc = stmt.ok() ? stmt.step() : stmt.prepareResult();
            if (rc != SQLITE_DONE) {
                reportFailure(rc, "expireProTiers history", EngineErrorCode::InvariantViolation, error);
                return std::nullopt;
            }
        }
        if (!refreshEligibility(userId, error)) {
            return std::nullopt;
        }
    }

    rc = txn.commit();
    if (rc != SQLITE_OK) {
        reportFailure(rc, "expireProTiers commit", EngineErrorCode::InvariantViolation, error);
        return std::nullopt;
    }

    if (!expired.empty()) {
        LOG_INFO(geLedger, "Expired pro tier for %d user(s)", static_cast<int>(expired.size()));
    }
    return static_cast<int>(expired.size());
}

// ── Settings / maintenance ──────────────────────────────────

std::optional<QString> LedgerStore::getSetting(const QString& key)
{
    Statement stmt(m_db, "SELECT value FROM settings WHERE key = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind(1, key);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return stmt.text(0);
}

bool LedgerStore::setSetting(const QString& key, const QString& value)
{
    Statement stmt(m_db, R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )");
    if (!stmt.ok()) {
        LOG_ERROR(geLedger, "setSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    stmt.bind(1, key);
    stmt.bind(2, value);
    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR(geLedger, "setSetting failed for %s: %s", qUtf8Printable(key), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool LedgerStore::integrityCheck() const
{
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && std::strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace ge
