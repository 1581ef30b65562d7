// contest_feature_export.cpp — CLI tool for exporting per-event form features
//
// Pipeline: event CSV -> EventStore -> FeatureAssembler -> CSV / Parquet,
// optionally followed by a chronological train/validation/test split.
//
// Usage: ./contest_feature_export --input <events.csv> --output <features.csv|.parquet>

#include "cli_args.hpp"
#include "dataset/time_split.hpp"
#include "features/feature_assembler.hpp"
#include "features/feature_export.hpp"
#include "io/event_csv_reader.hpp"
#include "io/parquet_export.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --output <path> [options]\n"
              << "\n"
              << "  --input        Event CSV (id,date,participant_a,participant_b,score_a,score_b[,a_is_home])\n"
              << "  --output       Output file path (.csv or .parquet)\n"
              << "  --window       Form / home-away window size (default 10)\n"
              << "  --h2h-window   Head-to-head window size (default 10)\n"
              << "  --min-history  Skip events where either side has fewer prior events (default 0)\n"
              << "  --threads      Worker threads for index build and assembly (default 1)\n"
              << "  --no-label     Omit realized outcome columns\n"
              << "  --split-dir    Also write train/validation/test CSVs (70/15/15) to this directory\n"
              << "  --scale        standard|minmax: scale split features with statistics fitted on train\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;
    std::string split_dir;
    std::optional<dataset::ScalingMethod> scaling;
    AssemblerConfig config;

    // Parse CLI args
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--window" && i + 1 < argc) {
                config.window_size = static_cast<size_t>(cli::parse_count(argv[++i], arg, 1));
            } else if (arg == "--h2h-window" && i + 1 < argc) {
                config.h2h_window = static_cast<size_t>(cli::parse_count(argv[++i], arg, 1));
            } else if (arg == "--min-history" && i + 1 < argc) {
                config.min_history_games = static_cast<int>(cli::parse_count(argv[++i], arg, 0));
            } else if (arg == "--threads" && i + 1 < argc) {
                config.num_threads = static_cast<int>(cli::parse_count(argv[++i], arg, 1));
            } else if (arg == "--no-label") {
                config.include_label = false;
            } else if (arg == "--split-dir" && i + 1 < argc) {
                split_dir = argv[++i];
            } else if (arg == "--scale" && i + 1 < argc) {
                scaling = dataset::parse_scaling_method(argv[++i]);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Validate required args
    if (input_path.empty()) {
        std::cerr << "Missing required argument: --input\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }
    if (scaling && split_dir.empty()) {
        std::cerr << "--scale requires --split-dir\n";
        print_usage(argv[0]);
        return 1;
    }

    // Detect output format by file extension
    bool use_parquet = false;
    {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    auto t0 = std::chrono::steady_clock::now();

    EventStore store;
    try {
        store = EventStore::build(event_csv::read_events_file(input_path));
    } catch (const EventValidationError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    std::cout << "  " << store.size() << " events, "
              << store.participants().size() << " participants\n";

    FeatureAssembler assembler(store, config);
    std::cout << "  " << assembler.participant_index().participant_count() << " histories, "
              << assembler.pair_index().pair_count() << " pairs indexed\n";

    auto records = assembler.assemble();
    const auto& stats = assembler.stats();
    std::cout << "  " << stats.records_emitted << " records ("
              << stats.skipped_cold_start << " cold-start events skipped)\n";

    try {
        if (use_parquet) {
            auto status = parquet_export::write_parquet(records, output_path);
            if (!status.ok()) {
                std::cerr << "Failed to write Parquet: " << status.ToString() << "\n";
                return 1;
            }
        } else {
            ExportConfig export_cfg;
            export_cfg.output_path = output_path;
            export_cfg.include_label = config.include_label;
            FeatureExporter exporter(export_cfg);
            exporter.export_csv(records);
        }

        if (!split_dir.empty()) {
            std::filesystem::create_directories(split_dir);
            auto split = dataset::time_based_split(records);

            // Scaler statistics come from the training rows only.
            std::optional<dataset::FeatureScaler> scaler;
            if (scaling) {
                if (split.train.empty()) {
                    std::cerr << "ERROR: --scale needs at least one training row\n";
                    return 1;
                }
                scaler.emplace(*scaling);
                scaler->fit(dataset::to_matrix(split.train));
            }

            const std::vector<std::pair<std::string, const std::vector<FeatureRecord>*>> parts = {
                {"train", &split.train}, {"validation", &split.validation}, {"test", &split.test}};
            for (const auto& [name, rows] : parts) {
                ExportConfig part_cfg;
                part_cfg.output_path = (std::filesystem::path(split_dir) / (name + ".csv")).string();
                part_cfg.include_label = config.include_label;
                FeatureExporter part_exporter(part_cfg);
                if (scaler) {
                    part_exporter.export_csv(*rows, scaler->transform(dataset::to_matrix(*rows)));
                } else {
                    part_exporter.export_csv(*rows);
                }
                std::cout << "  " << name << ": " << rows->size() << " rows"
                          << (scaler ? " (scaled)" : "") << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "  wrote " << output_path << " in " << elapsed << "s\n";
    return 0;
}
