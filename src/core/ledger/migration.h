#pragma once

struct sqlite3;

namespace ge {

// Bring the ledger schema up to targetVersion. Downgrades are refused.
bool applyMigrations(sqlite3* db, int targetVersion);

// Read schema_version from the settings table.
// Returns 0 if the table does not exist yet (fresh database).
int currentSchemaVersion(sqlite3* db);

} // namespace ge
