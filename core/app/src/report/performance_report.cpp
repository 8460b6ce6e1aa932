#include "simex/report/performance_report.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace simex {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;
constexpr double kSqrtTwoPi = 2.5066282746310002;

}  // namespace

std::vector<double> periodReturns(const domain::EquityCurve& curve) {
  std::vector<double> returns;
  if (curve.size() < 2) {
    return returns;
  }
  returns.reserve(curve.size() - 1);
  for (std::size_t i = 1; i < curve.size(); ++i) {
    double prev = curve[i - 1].equity;
    returns.push_back(prev != 0.0 ? curve[i].equity / prev - 1.0 : 0.0);
  }
  return returns;
}

double maxDrawdown(const domain::EquityCurve& curve) {
  double peak = 0.0;
  double worst = 0.0;
  for (const auto& point : curve) {
    peak = std::max(peak, point.equity);
    if (peak > 0.0) {
      worst = std::max(worst, (peak - point.equity) / peak);
    }
  }
  return worst;
}

double normalCdf(double x) { return 0.5 * std::erfc(-x / std::sqrt(2.0)); }

// Acklam's rational approximation, polished with one Halley step.
double normalQuantile(double p) {
  if (p <= 0.0) return -std::numeric_limits<double>::infinity();
  if (p >= 1.0) return std::numeric_limits<double>::infinity();

  static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                             -2.759285104469687e+02, 1.383577518672690e+02,
                             -3.066479806614716e+01, 2.506628277459239e+00};
  static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                             -1.556989798598866e+02, 6.680131188771972e+01,
                             -1.328068155288572e+01};
  static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                             -2.400758277161838e+00, -2.549732539343734e+00,
                             4.374664141464968e+00,  2.938163982698783e+00};
  static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                             2.445134137142996e+00, 3.754408661907416e+00};
  constexpr double kLow = 0.02425;

  double x = 0.0;
  if (p < kLow) {
    double q = std::sqrt(-2.0 * std::log(p));
    x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  } else if (p <= 1.0 - kLow) {
    double q = p - 0.5;
    double r = q * q;
    x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) *
        q /
        (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
  } else {
    double q = std::sqrt(-2.0 * std::log(1.0 - p));
    x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
        ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }

  double e = normalCdf(x) - p;
  double u = e * kSqrtTwoPi * std::exp(x * x / 2.0);
  return x - u / (1.0 + x * u / 2.0);
}

double deflatedSharpe(const std::vector<double>& returns, int n_trials) {
  if (returns.size() < 2) {
    return 0.0;
  }
  double n = static_cast<double>(returns.size());
  double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;

  double m2 = 0.0;
  double m3 = 0.0;
  double m4 = 0.0;
  for (double r : returns) {
    double dev = r - mean;
    m2 += dev * dev;
    m3 += dev * dev * dev;
    m4 += dev * dev * dev * dev;
  }
  double stddev = std::sqrt(m2 / (n - 1.0));
  if (!(stddev > 0.0)) {
    return 0.0;
  }
  m2 /= n;
  m3 /= n;
  m4 /= n;
  double skew = m3 / std::pow(m2, 1.5);
  double kurt = m4 / (m2 * m2);

  double sr = mean / stddev;
  double var_sr = (1.0 - skew * sr + (kurt - 1.0) / 4.0 * sr * sr) / (n - 1.0);
  if (!(var_sr > 0.0)) {
    return 0.0;
  }
  double sigma_sr = std::sqrt(var_sr);

  // Expected maximum Sharpe of n_trials independent zero-skill strategies.
  double sr0 = 0.0;
  if (n_trials > 1) {
    double trials = static_cast<double>(n_trials);
    sr0 = sigma_sr *
          ((1.0 - kEulerGamma) * normalQuantile(1.0 - 1.0 / trials) +
           kEulerGamma * normalQuantile(1.0 - 1.0 / (trials * std::exp(1.0))));
  }
  return normalCdf((sr - sr0) / sigma_sr);
}

PerformanceSummary summarize(const domain::EquityCurve& curve,
                             const std::vector<domain::Trade>& trades,
                             int n_trials) {
  PerformanceSummary s;
  s.bars = curve.size();
  s.trades = trades.size();
  s.total_fees = std::accumulate(
      trades.begin(), trades.end(), 0.0,
      [](double acc, const domain::Trade& t) { return acc + t.fee; });

  if (curve.empty()) {
    return s;
  }

  s.initial_equity = curve.front().equity;
  s.final_equity = curve.back().equity;
  if (s.initial_equity != 0.0) {
    s.total_return = s.final_equity / s.initial_equity - 1.0;
  }
  s.max_drawdown = maxDrawdown(curve);

  std::vector<double> returns = periodReturns(curve);
  if (returns.size() >= 2) {
    double n = static_cast<double>(returns.size());
    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double sq = 0.0;
    for (double r : returns) {
      sq += (r - mean) * (r - mean);
    }
    double stddev = std::sqrt(sq / (n - 1.0));
    if (stddev > 0.0) {
      s.sharpe = mean / stddev * std::sqrt(kTradingDaysPerYear);
      s.deflated_sharpe = deflatedSharpe(returns, n_trials);
    }
  }

  std::size_t moved = 0;
  std::size_t up = 0;
  for (double r : returns) {
    if (r != 0.0) {
      ++moved;
      if (r > 0.0) ++up;
    }
  }
  if (moved > 0) {
    s.hit_rate = static_cast<double>(up) / static_cast<double>(moved);
  }

  return s;
}

nlohmann::json toJson(const PerformanceSummary& s) {
  return nlohmann::json{
      {"bars", s.bars},
      {"trades", s.trades},
      {"initial_equity", s.initial_equity},
      {"final_equity", s.final_equity},
      {"total_return", s.total_return},
      {"sharpe", s.sharpe},
      {"deflated_sharpe", s.deflated_sharpe},
      {"hit_rate", s.hit_rate},
      {"max_drawdown", s.max_drawdown},
      {"total_fees", s.total_fees},
  };
}

}  // namespace simex
