#include "token_store.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace tokenwarden {

TokenStore::TokenStore(const std::string& db_path) {
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageError("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open token DB " + db_path + ": " + msg);
    }
    try {
        init_db();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

TokenStore::~TokenStore() {
    if (db_) sqlite3_close(db_);
}

void TokenStore::fail(const std::string& what) {
    throw StorageError(what + ": " + sqlite3_errmsg(db_));
}

void TokenStore::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tokens (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            expires_at TEXT NOT NULL,
            last_notified TEXT
        );
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("Failed to init token DB: " + msg);
    }
}

sqlite3_stmt* TokenStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        fail("prepare failed");
    }
    return stmt;
}

void TokenStore::add(const std::string& name, const std::string& expires_at) {
    auto date = CivilDate::parse(expires_at);
    if (!date) {
        throw ValidationError("Invalid expiry date '" + expires_at + "', expected YYYY-MM-DD");
    }

    // REPLACE deletes the old row, so last_notified comes back NULL.
    sqlite3_stmt* stmt = prepare("INSERT OR REPLACE INTO tokens (name, expires_at) VALUES (?, ?)");
    sqlite3_bind_text(stmt, 1, name.c_str(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    std::string stored = date->to_string();
    sqlite3_bind_text(stmt, 2, stored.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("Failed to add token '" + name + "'");
    }
}

bool TokenStore::remove(const std::string& name) {
    sqlite3_stmt* stmt = prepare("DELETE FROM tokens WHERE name = ?");
    sqlite3_bind_text(stmt, 1, name.c_str(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("Failed to remove token '" + name + "'");
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<TokenRecord> TokenStore::query_records(sqlite3_stmt* stmt) {
    std::vector<TokenRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TokenRecord r;
        r.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        std::string expires = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        auto date = CivilDate::parse(expires);
        if (!date) {
            sqlite3_finalize(stmt);
            throw StorageError("Corrupt expiry date '" + expires + "' for token '" + r.name + "'");
        }
        r.expires_at = *date;
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            r.last_notified = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        }
        records.push_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("Failed to read tokens");
    }
    return records;
}

std::vector<TokenRecord> TokenStore::list() {
    return query_records(prepare("SELECT name, expires_at, last_notified FROM tokens"));
}

std::vector<TokenRecord> TokenStore::find_expiring(int64_t threshold_days, const CivilDate& today) {
    sqlite3_stmt* stmt = prepare(
        "SELECT name, expires_at, last_notified FROM tokens "
        "WHERE date(expires_at) <= date(?)");
    std::string cutoff = today.add_days(threshold_days).to_string();
    sqlite3_bind_text(stmt, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);
    return query_records(stmt);
}

void TokenStore::mark_notified(const std::string& name, const std::string& timestamp) {
    sqlite3_stmt* stmt = prepare("UPDATE tokens SET last_notified = ? WHERE name = ?");
    sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("Failed to update last_notified for '" + name + "'");
    }
}

} // namespace tokenwarden
