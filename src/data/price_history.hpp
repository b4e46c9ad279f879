#pragma once

#include "research/errors.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <map>
#include <span>
#include <string>
#include <vector>

struct PriceBar {
    int date = 0;  // YYYYMMDD
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double trust_score = 0.0;          // precomputed pattern trust, [0, 1]
    double forecast_confidence = 0.0;  // precomputed forecast confidence, [0, 1]
};

// ---------------------------------------------------------------------------
// HistoricalDataProvider - read-only access to per-symbol daily history
// ---------------------------------------------------------------------------
class HistoricalDataProvider {
public:
    virtual ~HistoricalDataProvider() = default;

    // Bars for `symbol` with start <= date <= end, ascending by date.
    // Throws DataUnavailableError when the symbol is unknown.
    virtual std::span<const PriceBar> bars(const std::string& symbol,
                                           int start, int end) const = 0;

    virtual bool has_symbol(const std::string& symbol) const = 0;
};

// ---------------------------------------------------------------------------
// PriceHistoryStore - in-memory history, loaded once and then immutable
// ---------------------------------------------------------------------------
class PriceHistoryStore : public HistoricalDataProvider {
public:
    PriceHistoryStore() = default;

    void add(const std::string& symbol, const PriceBar& bar) {
        if (!time_utils::is_valid_date(bar.date)) {
            throw InvalidRangeError("invalid bar date " + std::to_string(bar.date)
                                    + " for " + symbol);
        }
        series_[symbol].push_back(bar);
        finalized_ = false;
    }

    // Sort each series by date. Duplicate dates keep the first bar added.
    void finalize() {
        for (auto& [symbol, series] : series_) {
            std::stable_sort(series.begin(), series.end(),
                             [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });
            series.erase(std::unique(series.begin(), series.end(),
                                     [](const PriceBar& a, const PriceBar& b) {
                                         return a.date == b.date;
                                     }),
                         series.end());
        }
        finalized_ = true;
    }

    std::span<const PriceBar> bars(const std::string& symbol,
                                   int start, int end) const override {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            throw DataUnavailableError("no history for symbol " + symbol);
        }
        if (!finalized_) {
            throw std::logic_error("PriceHistoryStore::finalize() not called");
        }
        const auto& series = it->second;
        auto lo = std::lower_bound(series.begin(), series.end(), start,
                                   [](const PriceBar& b, int d) { return b.date < d; });
        auto hi = std::upper_bound(series.begin(), series.end(), end,
                                   [](int d, const PriceBar& b) { return d < b.date; });
        if (lo >= hi) return {};
        return std::span<const PriceBar>(&*lo, static_cast<size_t>(hi - lo));
    }

    bool has_symbol(const std::string& symbol) const override {
        return series_.count(symbol) > 0;
    }

    std::vector<std::string> symbols() const {
        std::vector<std::string> out;
        for (const auto& [symbol, series] : series_) out.push_back(symbol);
        return out;
    }

    size_t bar_count() const {
        size_t n = 0;
        for (const auto& [symbol, series] : series_) n += series.size();
        return n;
    }

    bool empty() const { return series_.empty(); }

    const std::map<std::string, std::vector<PriceBar>>& all() const { return series_; }

private:
    std::map<std::string, std::vector<PriceBar>> series_;
    bool finalized_ = true;
};
