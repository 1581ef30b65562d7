#pragma once

#include "features/feature_assembler.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// dataset namespace — chronological train/validation/test preparation
// ---------------------------------------------------------------------------
namespace dataset {

struct DatasetSplit {
    std::vector<FeatureRecord> train;
    std::vector<FeatureRecord> validation;
    std::vector<FeatureRecord> test;
};

// Contiguous split of chronologically ordered records: every training row
// precedes every validation row, which precedes every test row.
//   train = [0, floor(n * train_ratio))
//   validation = [train_end, floor(n * (train_ratio + val_ratio)))
//   test = the rest
inline DatasetSplit time_based_split(const std::vector<FeatureRecord>& records,
                                     double train_ratio = 0.7, double val_ratio = 0.15,
                                     double test_ratio = 0.15) {
    if (train_ratio < 0.0 || val_ratio < 0.0 || test_ratio < 0.0) {
        throw std::invalid_argument("Split ratios must be non-negative");
    }
    if (std::abs(train_ratio + val_ratio + test_ratio - 1.0) >= 0.01) {
        throw std::invalid_argument("Split ratios must sum to 1.0");
    }
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i].timestamp < records[i - 1].timestamp) {
            throw std::invalid_argument("Records are not in chronological order at row " +
                                        std::to_string(i));
        }
    }

    size_t n = records.size();
    auto train_end = static_cast<size_t>(static_cast<double>(n) * train_ratio);
    auto val_end = static_cast<size_t>(static_cast<double>(n) * (train_ratio + val_ratio));
    val_end = std::min(std::max(val_end, train_end), n);

    DatasetSplit split;
    split.train.assign(records.begin(), records.begin() + train_end);
    split.validation.assign(records.begin() + train_end, records.begin() + val_end);
    split.test.assign(records.begin() + val_end, records.end());
    return split;
}

// Row-major feature matrix in FeatureRecord::feature_names() order.
inline std::vector<std::vector<float>> to_matrix(const std::vector<FeatureRecord>& records) {
    std::vector<std::vector<float>> x;
    x.reserve(records.size());
    for (const auto& r : records) x.push_back(r.feature_values());
    return x;
}

// Binary target (participant a won). Every record must carry a label.
inline std::vector<int> labels(const std::vector<FeatureRecord>& records) {
    std::vector<int> y;
    y.reserve(records.size());
    for (const auto& r : records) {
        if (!r.has_label) {
            throw std::invalid_argument("Record for event " + std::to_string(r.event_id) +
                                        " has no label");
        }
        y.push_back(r.label_a_win);
    }
    return y;
}

// ---------------------------------------------------------------------------
// FeatureScaler — column scaling fitted on training rows only
// ---------------------------------------------------------------------------
enum class ScalingMethod { Standard, MinMax };

class FeatureScaler {
public:
    explicit FeatureScaler(ScalingMethod method = ScalingMethod::Standard) : method_(method) {}

    void fit(const std::vector<std::vector<float>>& x) {
        if (x.empty()) throw std::invalid_argument("FeatureScaler::fit requires at least one row");
        size_t width = x.front().size();
        check_width(x, width);

        offset_.assign(width, 0.0);
        scale_.assign(width, 0.0);

        for (size_t c = 0; c < width; ++c) {
            if (method_ == ScalingMethod::Standard) {
                double sum = 0.0;
                for (const auto& row : x) sum += row[c];
                double mean = sum / static_cast<double>(x.size());
                double ss = 0.0;
                for (const auto& row : x) ss += (row[c] - mean) * (row[c] - mean);
                // Population std, matching StandardScaler.
                offset_[c] = mean;
                scale_[c] = std::sqrt(ss / static_cast<double>(x.size()));
            } else {
                double lo = x.front()[c];
                double hi = x.front()[c];
                for (const auto& row : x) {
                    lo = std::min(lo, static_cast<double>(row[c]));
                    hi = std::max(hi, static_cast<double>(row[c]));
                }
                offset_[c] = lo;
                scale_[c] = hi - lo;
            }
            // Constant training column: shift only, as StandardScaler/MinMaxScaler do.
            if (scale_[c] == 0.0) scale_[c] = 1.0;
        }
        fitted_ = true;
    }

    std::vector<std::vector<float>> transform(const std::vector<std::vector<float>>& x) const {
        if (!fitted_) throw std::logic_error("FeatureScaler::transform called before fit");
        check_width(x, offset_.size());

        std::vector<std::vector<float>> out(x.size(), std::vector<float>(offset_.size(), 0.0f));
        for (size_t r = 0; r < x.size(); ++r) {
            for (size_t c = 0; c < offset_.size(); ++c) {
                out[r][c] = static_cast<float>((x[r][c] - offset_[c]) / scale_[c]);
            }
        }
        return out;
    }

    std::vector<std::vector<float>> fit_transform(const std::vector<std::vector<float>>& x) {
        fit(x);
        return transform(x);
    }

    bool fitted() const { return fitted_; }
    ScalingMethod method() const { return method_; }
    const std::vector<double>& offsets() const { return offset_; }
    const std::vector<double>& scales() const { return scale_; }

private:
    ScalingMethod method_;
    bool fitted_ = false;
    std::vector<double> offset_;
    std::vector<double> scale_;

    static void check_width(const std::vector<std::vector<float>>& x, size_t width) {
        for (size_t r = 0; r < x.size(); ++r) {
            if (x[r].size() != width) {
                throw std::invalid_argument("Row " + std::to_string(r) + " has " +
                                            std::to_string(x[r].size()) + " columns, expected " +
                                            std::to_string(width));
            }
        }
    }
};

inline ScalingMethod parse_scaling_method(const std::string& name) {
    if (name == "standard") return ScalingMethod::Standard;
    if (name == "minmax") return ScalingMethod::MinMax;
    throw std::invalid_argument("Unknown scaling method: " + name);
}

}  // namespace dataset
