#pragma once

#include "core/alerts.h"
#include "util/config.h"

#include <string>

class TG {
  const std::string token;
  const std::string chat_id;
  const bool enabled;

 public:
  TG(const APIConfig& cfg, bool enabled)
      : token{cfg.tg_token}, chat_id{cfg.tg_chat_id}, enabled{enabled} {}

  // message id, -1 on failure or when disabled
  int send(const std::string& text) const;
  int send(const AlertPayload& alert) const;
};
