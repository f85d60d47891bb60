#pragma once

// ============================================================
// rate_estimator.hpp -- Rolling median of throughput samples
//
// Per-chunk throughput is bursty (page cache, network shares);
// the median of the last N samples gives a stable ETA.
// ============================================================

#include <deque>
#include <vector>
#include <algorithm>
#include <cstddef>

class RateEstimator {
public:
    explicit RateEstimator(size_t window_size = 10)
        : window_size_(window_size == 0 ? 1 : window_size) {}

    // Append a sample, evicting the oldest once the window is full
    void add(double value) {
        window_.push_back(value);
        if (window_.size() > window_size_) {
            window_.pop_front();
        }
    }

    // Median of the current window; mean of the middle pair for an even
    // count, 0 for an empty window
    double median() const {
        if (window_.empty()) return 0.0;
        std::vector<double> sorted(window_.begin(), window_.end());
        std::sort(sorted.begin(), sorted.end());
        size_t n = sorted.size();
        if (n % 2 == 1) return sorted[n / 2];
        return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
    }

    size_t size() const { return window_.size(); }
    size_t window_size() const { return window_size_; }
    bool empty() const { return window_.empty(); }

private:
    size_t             window_size_;
    std::deque<double> window_;
};
