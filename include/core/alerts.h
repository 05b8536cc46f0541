#pragma once

#include "core/analysis.h"
#include "sig/signal_types.h"

#include <map>
#include <string>

// Plain alert data; rendering is left to the sender.
struct AlertPayload {
  std::string title;
  std::string body;
  Severity severity = Severity::Low;
  std::map<std::string, std::string> metadata;
};

AlertPayload make_alert(const ComprehensiveAnalysis& analysis);
AlertPayload make_alert(const TechnicalAnalysis& analysis);
