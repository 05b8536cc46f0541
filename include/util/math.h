#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

constexpr double clamp(double x, double lo, double hi) {
  return std::min(std::max(x, lo), hi);
}

inline double mean(auto start, auto end) {
  auto n = std::distance(start, end);
  if (n <= 0)
    return 0.0;
  return std::accumulate(start, end, 0.0) / n;
}

// population standard deviation
inline double stdev(auto start, auto end) {
  auto n = std::distance(start, end);
  if (n <= 0)
    return 0.0;

  auto mu = mean(start, end);
  double var = 0.0;
  for (auto it = start; it != end; it++)
    var += (*it - mu) * (*it - mu);
  return std::sqrt(var / n);
}

inline std::vector<double> returns(const std::vector<double>& prices) {
  std::vector<double> res;
  if (prices.size() < 2)
    return res;

  res.reserve(prices.size() - 1);
  for (size_t i = 1; i < prices.size(); i++)
    res.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
  return res;
}
