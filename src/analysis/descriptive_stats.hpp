#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// DescriptiveStats - summary of a sample after dropping non-finite values
// ---------------------------------------------------------------------------
struct DescriptiveStats {
    int count = 0;          // finite values used
    int invalid_count = 0;  // NaN / inf values excluded
    double mean = std::numeric_limits<double>::quiet_NaN();
    double stddev = std::numeric_limits<double>::quiet_NaN();  // population
    double median = std::numeric_limits<double>::quiet_NaN();
    double p25 = std::numeric_limits<double>::quiet_NaN();
    double p75 = std::numeric_limits<double>::quiet_NaN();
    double min = std::numeric_limits<double>::quiet_NaN();
    double max = std::numeric_limits<double>::quiet_NaN();
};

namespace stats {

inline double mean(const std::vector<double>& v) {
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

inline double population_std(const std::vector<double>& v) {
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    double m = mean(v);
    double sum_sq = 0.0;
    for (double x : v) sum_sq += (x - m) * (x - m);
    return std::sqrt(sum_sq / static_cast<double>(v.size()));
}

// Linear interpolation between closest ranks; `q` in [0, 1]. Input sorted.
inline double percentile_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (sorted.size() == 1) return sorted.front();
    double pos = q * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

inline DescriptiveStats describe(const std::vector<double>& values) {
    DescriptiveStats d;
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double x : values) {
        if (std::isfinite(x)) {
            finite.push_back(x);
        } else {
            ++d.invalid_count;
        }
    }
    d.count = static_cast<int>(finite.size());
    if (finite.empty()) return d;

    std::sort(finite.begin(), finite.end());
    d.mean = mean(finite);
    d.stddev = population_std(finite);
    d.median = percentile_sorted(finite, 0.5);
    d.p25 = percentile_sorted(finite, 0.25);
    d.p75 = percentile_sorted(finite, 0.75);
    d.min = finite.front();
    d.max = finite.back();
    return d;
}

// Two-sample z statistic for a drop from group a to group b (positive when
// b is lower). NaN when either group is too small or has no spread.
inline double drop_z_score(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() < 2 || b.size() < 2) return std::numeric_limits<double>::quiet_NaN();
    double sa = population_std(a);
    double sb = population_std(b);
    double se = std::sqrt(sa * sa / static_cast<double>(a.size())
                          + sb * sb / static_cast<double>(b.size()));
    if (!(se > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    return (mean(a) - mean(b)) / se;
}

}  // namespace stats
