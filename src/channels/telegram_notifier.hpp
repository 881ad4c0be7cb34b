#pragma once
#include "notifier.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../https_client.hpp"

namespace tokenwarden {

// Posts to the Bot API sendMessage method. destination is the chat id.
class TelegramNotifier : public Notifier {
public:
    explicit TelegramNotifier(const TelegramConfig& cfg)
        : config_(cfg) {}

    std::string name() const override { return "telegram"; }

    void send(const std::string& destination, const std::string& text) override {
        std::string path = "/bot" + config_.bot_token + "/sendMessage";
        auto resp = https_post_form(config_.api_base, path,
                                    {{"chat_id", destination}, {"text", text}});

        if (resp.status == 0) {
            throw NotificationDeliveryError("sendMessage failed (" + resp.body + ")");
        }
        if (!resp.ok()) {
            throw NotificationDeliveryError("sendMessage failed: status=" + std::to_string(resp.status));
        }
    }

private:
    TelegramConfig config_;
};

} // namespace tokenwarden
