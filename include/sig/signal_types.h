#pragma once

#include <string>
#include <vector>

enum class Severity { Urgent = 4, High = 3, Medium = 2, Low = 1 };

enum class Signal { Buy, Sell, Neutral };

// a sub-analysis that failed while the rest of the call went through
struct Failure {
  std::string part;
  std::string what;
};

using Failures = std::vector<Failure>;
