#pragma once
#include "civil_date.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <sqlite3.h>

namespace tokenwarden {

struct TokenRecord {
    std::string name;
    CivilDate expires_at;
    std::optional<std::string> last_notified;  // UTC "YYYY-MM-DD HH:MM:SS"
};

// SQLite-backed set of tracked tokens keyed by name. Every SQLite failure
// surfaces as StorageError.
class TokenStore {
public:
    explicit TokenStore(const std::string& db_path);
    ~TokenStore();

    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    // Insert or replace. Replacing drops last_notified.
    // Throws ValidationError if expires_at is not YYYY-MM-DD.
    void add(const std::string& name, const std::string& expires_at);

    // Returns true if a row was deleted. Absent names are not an error.
    bool remove(const std::string& name);

    std::vector<TokenRecord> list();

    // Records with expires_at <= today + threshold_days.
    std::vector<TokenRecord> find_expiring(int64_t threshold_days, const CivilDate& today);

    // No-op if the record is gone.
    void mark_notified(const std::string& name, const std::string& timestamp);

private:
    sqlite3* db_ = nullptr;
    void init_db();
    sqlite3_stmt* prepare(const char* sql);
    std::vector<TokenRecord> query_records(sqlite3_stmt* stmt);
    [[noreturn]] void fail(const std::string& what);
};

} // namespace tokenwarden
