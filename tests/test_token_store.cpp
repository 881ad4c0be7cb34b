#include <gtest/gtest.h>
#include "token_store.hpp"
#include "errors.hpp"
#include "expiry.hpp"
#include "temp_dir.hpp"
#include <algorithm>

using tokenwarden::CivilDate;
using tokenwarden::TokenRecord;
using tokenwarden::TokenStore;

static std::vector<std::string> names_of(const std::vector<TokenRecord>& records) {
    std::vector<std::string> names;
    for (auto& r : records) names.push_back(r.name);
    std::sort(names.begin(), names.end());
    return names;
}

TEST(TokenStoreTest, add_then_list_round_trips_name_and_expiry) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("github-pat", "2024-02-29");
    store.add("Github-PAT", "2031-12-31");

    auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    for (auto& r : all) {
        if (r.name == "github-pat") EXPECT_EQ(r.expires_at.to_string(), "2024-02-29");
        else EXPECT_EQ(r.expires_at.to_string(), "2031-12-31");
        EXPECT_FALSE(r.last_notified.has_value());
    }
}

TEST(TokenStoreTest, malformed_date_is_rejected_without_writing) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("aws-key", "2024-05-01");

    EXPECT_THROW(store.add("aws-key", "2024-13-40"), tokenwarden::ValidationError);
    EXPECT_THROW(store.add("new-key", "not-a-date"), tokenwarden::ValidationError);

    auto all = store.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "aws-key");
    EXPECT_EQ(all[0].expires_at.to_string(), "2024-05-01");
}

TEST(TokenStoreTest, re_add_replaces_expiry_and_clears_notification_state) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("X", "2024-01-01");
    store.mark_notified("X", "2024-01-01 08:00:00");
    ASSERT_TRUE(store.list()[0].last_notified.has_value());

    store.add("X", "2025-01-01");

    auto all = store.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "X");
    EXPECT_EQ(all[0].expires_at.to_string(), "2025-01-01");
    EXPECT_FALSE(all[0].last_notified.has_value());
}

TEST(TokenStoreTest, remove_is_idempotent) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("slack-token", "2024-03-01");

    EXPECT_TRUE(store.remove("slack-token"));
    EXPECT_FALSE(store.remove("slack-token"));
    EXPECT_NO_THROW(store.remove("never-existed"));
    EXPECT_TRUE(store.list().empty());
}

TEST(TokenStoreTest, find_expiring_uses_inclusive_calendar_window) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("tomorrow", "2024-06-11");
    store.add("day-after", "2024-06-12");
    store.add("expired", "2024-06-01");

    auto due = store.find_expiring(1, *CivilDate::parse("2024-06-10"));
    EXPECT_EQ(names_of(due), (std::vector<std::string>{"expired", "tomorrow"}));

    due = store.find_expiring(2, *CivilDate::parse("2024-06-10"));
    EXPECT_EQ(due.size(), 3u);
}

TEST(TokenStoreTest, mark_notified_sets_timestamp_and_ignores_missing_records) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    store.add("svc", "2024-06-11");

    store.mark_notified("svc", "2024-06-10 09:30:00");
    EXPECT_NO_THROW(store.mark_notified("gone", "2024-06-10 09:30:00"));

    auto all = store.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].last_notified.value_or(""), "2024-06-10 09:30:00");
}

TEST(TokenStoreTest, records_survive_reopen) {
    TempDir dir;
    {
        TokenStore store(dir.file("tokens.db"));
        store.add("persisted", "2027-07-07");
    }
    TokenStore reopened(dir.file("tokens.db"));
    auto all = reopened.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "persisted");
}

TEST(TokenStoreTest, creates_missing_parent_directories) {
    TempDir dir;
    TokenStore store(dir.file("nested/deeper/tokens.db"));
    store.add("a", "2024-01-01");
    EXPECT_EQ(store.list().size(), 1u);
}

TEST(TokenStoreTest, unopenable_database_raises_storage_error) {
    TempDir dir;
    // A directory cannot be opened as a database file.
    EXPECT_THROW(TokenStore store(dir.path.string()), tokenwarden::StorageError);
}

TEST(TokenStoreTest, end_to_end_expired_token_is_found_with_expired_message) {
    TempDir dir;
    TokenStore store(dir.file("tokens.db"));
    ASSERT_TRUE(store.list().empty());

    store.add("svc-key", "2024-01-01");
    auto today = *CivilDate::parse("2024-01-02");
    auto due = store.find_expiring(0, today);

    ASSERT_EQ(names_of(due), std::vector<std::string>{"svc-key"});
    auto msg = tokenwarden::format_expiry_message(
        due[0].name, tokenwarden::days_remaining(due[0].expires_at, today));
    EXPECT_NE(msg.find("EXPIRED"), std::string::npos);
}
