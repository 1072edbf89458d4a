#include "core/ledger/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <cstdlib>

namespace ge {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = std::atoi(val);
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(geLedger, "Schema version %d is newer than engine version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(geLedger, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(geLedger, "Applying schema migration 1 -> 2");

        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }

        const bool ok = exec(R"(
            CREATE TABLE IF NOT EXISTS featuring_events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                site_id TEXT NOT NULL REFERENCES sites(id),
                share_multiple INTEGER NOT NULL CHECK (share_multiple > 0),
                duration_hours INTEGER NOT NULL,
                featured_from INTEGER NOT NULL,
                featured_until INTEGER NOT NULL,
                created_at INTEGER NOT NULL,
                UNIQUE(site_id, share_multiple)
            );
        )")
            && exec(R"(
            CREATE TABLE IF NOT EXISTS commission_claims (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                user_id TEXT NOT NULL REFERENCES users(id),
                period TEXT NOT NULL,
                amount INTEGER NOT NULL CHECK (amount >= 0),
                claimed_at INTEGER NOT NULL,
                UNIQUE(user_id, period)
            );
        )")
            && exec("CREATE INDEX IF NOT EXISTS idx_featuring_events_site ON featuring_events(site_id);")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            exec("ROLLBACK");
            return false;
        }
        if (!exec("COMMIT")) {
            exec("ROLLBACK");
            return false;
        }

        current = 2;
    }

    if (current != targetVersion) {
        LOG_ERROR(geLedger, "Schema migration incomplete: current=%d target=%d",
                  current, targetVersion);
        return false;
    }

    LOG_INFO(geLedger, "Schema migrations complete: version %d", current);
    return true;
}

} // namespace ge
