#include "commands.hpp"
#include "expiry_daemon.hpp"
#include "channels/telegram_notifier.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tokenwarden {

void print_usage() {
    std::cout << "Usage: tokenwarden [--config PATH] [--db PATH] <command> [args]\n\n"
              << "Commands:\n"
              << "  add <name> <YYYY-MM-DD>     Track a token (replaces an existing one)\n"
              << "  remove <name>               Stop tracking a token\n"
              << "  list                        Show tracked tokens\n"
              << "  daemon                      Notify about expiring tokens until stopped\n"
              << "  check                       Run a single notification sweep\n"
              << "  help                        Show this message\n";
}

int cmd_add(const Config& cfg, const std::string& name, const std::string& expires_at) {
    TokenStore store(cfg.database_path());
    store.add(name, expires_at);
    std::cout << "Token '" << name << "' added successfully!\n";
    return 0;
}

int cmd_remove(const Config& cfg, const std::string& name) {
    TokenStore store(cfg.database_path());
    store.remove(name);
    std::cout << "Token '" << name << "' removed successfully!\n";
    return 0;
}

std::string format_token_table(const std::vector<TokenRecord>& tokens) {
    std::ostringstream out;
    out << "Tracked Tokens:\n";
    out << std::left << std::setw(20) << "Name" << " "
        << std::setw(15) << "Expires" << " " << "Last Notified\n";
    out << std::string(50, '-') << "\n";
    for (auto& t : tokens) {
        out << std::left << std::setw(20) << t.name << " "
            << std::setw(15) << t.expires_at.to_string() << " "
            << t.last_notified.value_or("Never") << "\n";
    }
    return out.str();
}

int cmd_list(const Config& cfg) {
    TokenStore store(cfg.database_path());
    std::cout << format_token_table(store.list());
    return 0;
}

int cmd_check(const Config& cfg) {
    cfg.require_messaging();
    TokenStore store(cfg.database_path());
    TelegramNotifier notifier(cfg.telegram);
    ExpiryDaemon daemon(store, notifier, cfg.telegram.chat_id,
                        cfg.notification_threshold_days, cfg.check_interval_seconds);

    auto report = daemon.run_sweep();
    if (report.aborted) {
        std::cerr << "Error: sweep aborted: " << report.error << "\n";
        return 1;
    }
    std::cout << "Checked tokens: due=" << report.due
              << " notified=" << report.notified
              << " failed=" << report.failed << "\n";
    return 0;
}

int cmd_daemon(const Config& cfg, const std::atomic<bool>& running) {
    cfg.require_messaging();
    TokenStore store(cfg.database_path());
    TelegramNotifier notifier(cfg.telegram);
    ExpiryDaemon daemon(store, notifier, cfg.telegram.chat_id,
                        cfg.notification_threshold_days, cfg.check_interval_seconds);
    daemon.run(running);
    return 0;
}

int run_cli(const std::vector<std::string>& args, const std::atomic<bool>& running) {
    std::string config_path = default_config_path();
    std::string db_override;
    std::vector<std::string> rest;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--db" && i + 1 < args.size()) {
            db_override = args[++i];
        } else {
            rest.push_back(args[i]);
        }
    }

    if (rest.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = rest[0];
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cmd != "add" && cmd != "remove" && cmd != "list" && cmd != "check" && cmd != "daemon") {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }

    try {
        Config cfg = Config::load(config_path);
        if (!db_override.empty()) cfg.database = db_override;

        if (cmd == "add") {
            if (rest.size() != 3 || rest[1].empty()) {
                std::cerr << "Usage: tokenwarden add <name> <YYYY-MM-DD>\n";
                return 1;
            }
            return cmd_add(cfg, rest[1], rest[2]);
        }
        else if (cmd == "remove") {
            if (rest.size() != 2) {
                std::cerr << "Usage: tokenwarden remove <name>\n";
                return 1;
            }
            return cmd_remove(cfg, rest[1]);
        }
        else if (cmd == "list") {
            return cmd_list(cfg);
        }
        else if (cmd == "check") {
            return cmd_check(cfg);
        }
        return cmd_daemon(cfg, running);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace tokenwarden
