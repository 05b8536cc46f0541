#include "core/telegram.h"
#include "util/format.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

int TG::send(const std::string& text) const {
  spdlog::debug("[tg] send: {}...", text.substr(0, 20));
  if (!enabled || text == "")
    return -1;

  auto url = std::format("https://api.telegram.org/bot{}/sendMessage", token);
  auto r = cpr::Post(cpr::Url{url}, cpr::Payload{{"chat_id", chat_id},
                                                 {"text", text},
                                                 {"parse_mode", "Markdown"}});

  if (r.status_code != 200 || r.text == "") {
    spdlog::error("[tg] error {}: {}", r.status_code, r.text);
    return -1;
  }

  auto js = json::parse(r.text, nullptr, false);
  if (js.is_discarded() || !js.contains("result")) {
    spdlog::error("[tg] unexpected response: {}", r.text);
    return -1;
  }
  return js["result"].value("message_id", -1);
}

int TG::send(const AlertPayload& alert) const {
  return send(to_str<FormatTarget::Telegram>(alert));
}
