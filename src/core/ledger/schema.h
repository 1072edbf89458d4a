#pragma once

namespace ge {

// Per-connection pragmas. Safe on every open, no write lock required.
// busy_timeout bounds the wait on a held write lock. Past it, contention
// surfaces as SQLITE_BUSY and the ingestor boundary retries with backoff.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when the database is created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x47454e47;
)";

// Schema v1: sites, share ledger, referrals, commissions, milestones, showcase.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS users (
    id TEXT PRIMARY KEY,
    tier TEXT NOT NULL DEFAULT 'free' CHECK (tier IN ('free', 'pro')),
    pro_expires_at INTEGER,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS sites (
    id TEXT PRIMARY KEY,
    owner_id TEXT NOT NULL REFERENCES users(id),
    created_at INTEGER NOT NULL,
    pageviews INTEGER NOT NULL DEFAULT 0 CHECK (pageviews >= 0),
    total_shares INTEGER NOT NULL DEFAULT 0 CHECK (total_shares >= 0),
    last_triggered_multiple INTEGER NOT NULL DEFAULT 0,
    auto_featured_until INTEGER,
    showcase_eligible INTEGER NOT NULL DEFAULT 0,
    retired_at INTEGER,
    version INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_sites_owner ON sites(owner_id);
CREATE INDEX IF NOT EXISTS idx_sites_eligible ON sites(showcase_eligible, retired_at);

CREATE TABLE IF NOT EXISTS site_platform_shares (
    site_id TEXT NOT NULL REFERENCES sites(id),
    platform TEXT NOT NULL,
    share_count INTEGER NOT NULL DEFAULT 0 CHECK (share_count >= 0),
    PRIMARY KEY (site_id, platform)
);

CREATE TABLE IF NOT EXISTS share_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    idempotency_key TEXT NOT NULL UNIQUE,
    site_id TEXT NOT NULL REFERENCES sites(id),
    platform TEXT NOT NULL,
    occurred_at INTEGER NOT NULL,
    recorded_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_share_events_site ON share_events(site_id, occurred_at);

CREATE TABLE IF NOT EXISTS referral_edges (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    referrer_id TEXT NOT NULL REFERENCES users(id),
    referee_id TEXT NOT NULL REFERENCES users(id),
    converted_at INTEGER NOT NULL,
    status TEXT NOT NULL CHECK (status IN ('pending', 'active', 'churned')),
    updated_at INTEGER NOT NULL,
    CHECK (referrer_id != referee_id)
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_referral_edges_live_pair
    ON referral_edges(referrer_id, referee_id) WHERE status != 'churned';
CREATE INDEX IF NOT EXISTS idx_referral_edges_referrer ON referral_edges(referrer_id, status);

CREATE TABLE IF NOT EXISTS commission_entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    edge_id INTEGER NOT NULL REFERENCES referral_edges(id),
    period TEXT NOT NULL,
    period_start INTEGER NOT NULL,
    period_end INTEGER NOT NULL,
    kind TEXT NOT NULL CHECK (kind IN ('settlement', 'reversal')),
    reverses_entry_id INTEGER UNIQUE REFERENCES commission_entries(id),
    rate_bps INTEGER NOT NULL CHECK (rate_bps BETWEEN 0 AND 10000),
    base_amount INTEGER NOT NULL CHECK (base_amount >= 0),
    payable_amount INTEGER NOT NULL CHECK (payable_amount >= 0 AND payable_amount <= base_amount),
    settlement_status TEXT NOT NULL DEFAULT 'pending' CHECK (settlement_status IN ('pending', 'paid')),
    created_at INTEGER NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_commission_entries_settlement
    ON commission_entries(edge_id, period) WHERE kind = 'settlement';
CREATE INDEX IF NOT EXISTS idx_commission_entries_period ON commission_entries(period);

CREATE TABLE IF NOT EXISTS milestones (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL REFERENCES users(id),
    milestone_type TEXT NOT NULL,
    fired_at INTEGER NOT NULL,
    UNIQUE(user_id, milestone_type)
);

CREATE TABLE IF NOT EXISTS subscription_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL REFERENCES users(id),
    tier TEXT NOT NULL,
    source TEXT NOT NULL,
    started_at INTEGER NOT NULL,
    expires_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_subscription_history_user ON subscription_history(user_id);

CREATE TABLE IF NOT EXISTS showcase_entries (
    rank INTEGER PRIMARY KEY,
    site_id TEXT NOT NULL UNIQUE,
    owner_id TEXT NOT NULL,
    score REAL NOT NULL,
    boost_level TEXT NOT NULL,
    generation_id TEXT NOT NULL,
    generated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('showcaseGeneration', '');
INSERT OR IGNORE INTO settings (key, value) VALUES ('showcaseGeneratedAt', '0');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace ge
