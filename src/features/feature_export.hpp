#pragma once

#include "features/feature_assembler.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportConfig
// ---------------------------------------------------------------------------
struct ExportConfig {
    std::string output_path;
    bool include_label = true;
};

// ---------------------------------------------------------------------------
// FeatureExporter — FeatureRecord rows as CSV
// ---------------------------------------------------------------------------
class FeatureExporter {
public:
    FeatureExporter() = default;
    explicit FeatureExporter(const ExportConfig& config) : config_(config) {}

    // Header line (CSV).
    std::string header_line() const {
        std::ostringstream ss;
        // Metadata
        ss << "event_id,timestamp,date,participant_a,participant_b";

        for (const auto& name : FeatureRecord::feature_names()) {
            ss << "," << name;
        }

        if (config_.include_label) {
            ss << ",label_a_win,score_a,score_b";
        }
        return ss.str();
    }

    // Format a single row as CSV. Unlabeled rows write NaN targets.
    std::string format_row(const FeatureRecord& row) const {
        return format_row(row, row.feature_values());
    }

    // Same layout with caller-supplied feature values (e.g. scaled), which
    // must follow FeatureRecord::feature_names() order.
    std::string format_row(const FeatureRecord& row, const std::vector<float>& values) const {
        if (values.size() != FeatureRecord::feature_count()) {
            throw std::invalid_argument("Expected " + std::to_string(FeatureRecord::feature_count()) +
                                        " feature values, got " + std::to_string(values.size()));
        }
        std::ostringstream ss;
        ss << row.event_id;
        ss << "," << row.timestamp;
        ss << "," << time_utils::format_date(row.timestamp);
        ss << "," << row.participant_a;
        ss << "," << row.participant_b;

        for (float v : values) {
            ss << "," << format_float(v);
        }

        if (config_.include_label) {
            if (row.has_label) {
                ss << "," << row.label_a_win;
                ss << "," << format_float(row.score_a);
                ss << "," << format_float(row.score_b);
            } else {
                ss << ",NaN,NaN,NaN";
            }
        }
        return ss.str();
    }

    // Batch export to CSV.
    void export_csv(const std::vector<FeatureRecord>& rows) {
        auto file = open_output();
        if (!file.is_open()) return;
        for (const auto& row : rows) {
            file << format_row(row) << "\n";
        }
    }

    // Batch export with one feature-value row per record, e.g. the output of
    // dataset::FeatureScaler::transform(dataset::to_matrix(rows)).
    void export_csv(const std::vector<FeatureRecord>& rows,
                    const std::vector<std::vector<float>>& values) {
        if (values.size() != rows.size()) {
            throw std::invalid_argument("export_csv: " + std::to_string(rows.size()) +
                                        " records but " + std::to_string(values.size()) +
                                        " value rows");
        }
        auto file = open_output();
        if (!file.is_open()) return;
        for (size_t i = 0; i < rows.size(); ++i) {
            file << format_row(rows[i], values[i]) << "\n";
        }
    }

    // Streaming export.
    void begin() {
        if (config_.output_path.empty()) return;
        stream_.open(config_.output_path);
        if (!stream_.is_open()) {
            throw std::runtime_error("Cannot open output file: " + config_.output_path);
        }
        stream_ << header_line() << "\n";
    }

    void write_row(const FeatureRecord& row) {
        if (!stream_.is_open()) return;
        stream_ << format_row(row) << "\n";
    }

    void end() {
        if (stream_.is_open()) {
            stream_.close();
        }
    }

private:
    ExportConfig config_;
    std::ofstream stream_;

    // Opens config_.output_path and writes the header. Returns a closed
    // stream when no output path is configured.
    std::ofstream open_output() const {
        std::ofstream file;
        if (config_.output_path.empty()) return file;

        auto parent = std::filesystem::path(config_.output_path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }

        file.open(config_.output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + config_.output_path);
        }
        file << header_line() << "\n";
        return file;
    }

    static std::string format_float(float val) {
        if (std::isnan(val)) return "NaN";
        if (std::isinf(val)) return "Inf";
        std::ostringstream ss;
        ss.precision(std::numeric_limits<float>::max_digits10);
        ss << val;
        return ss.str();
    }
};
