#include "sig/patterns.h"

#include <unordered_map>

struct PatternMeta {
  Severity sev;
  std::string str = "";
};

inline const std::unordered_map<PatternKind, PatternMeta> pattern_meta = {
    {PatternKind::Box, {Severity::Low, "box"}},
    {PatternKind::Breakout, {Severity::High, "breakout"}},
    {PatternKind::Uptrend, {Severity::Medium, "uptrend"}},
    {PatternKind::Downtrend, {Severity::Medium, "downtrend"}},
    {PatternKind::DoubleTop, {Severity::High, "double top"}},
    {PatternKind::DoubleBottom, {Severity::High, "double bottom"}},
    {PatternKind::HeadAndShoulders, {Severity::Urgent, "head and shoulders"}},
};

Severity Pattern::severity() const {
  auto it = pattern_meta.find(kind);
  return it == pattern_meta.end() ? Severity::Low : it->second.sev;
}

std::string Pattern::str() const {
  auto it = pattern_meta.find(kind);
  return it == pattern_meta.end() ? "" : it->second.str;
}
