#pragma once
#include "config.hpp"
#include "token_store.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace tokenwarden {

int cmd_add(const Config& cfg, const std::string& name, const std::string& expires_at);
int cmd_remove(const Config& cfg, const std::string& name);
int cmd_list(const Config& cfg);
int cmd_check(const Config& cfg);
int cmd_daemon(const Config& cfg, const std::atomic<bool>& running);

std::string format_token_table(const std::vector<TokenRecord>& tokens);

void print_usage();

// Parses global options and the subcommand (args excludes argv[0]) and
// returns the process exit code. Errors are reported here, never thrown.
int run_cli(const std::vector<std::string>& args, const std::atomic<bool>& running);

} // namespace tokenwarden
