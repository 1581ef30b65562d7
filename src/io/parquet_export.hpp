#pragma once

// parquet_export.hpp — FeatureRecord table as a ZSTD-compressed Parquet file
//
// Schema: event_id, timestamp (INT64), participant_a, participant_b (INT64),
// one FLOAT column per FeatureRecord::feature_names() entry, then the
// nullable targets label_a_win (INT32), score_a, score_b (FLOAT).

#include "features/feature_assembler.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace parquet_export {

inline std::shared_ptr<arrow::Schema> feature_schema() {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("event_id", arrow::int64(), false));
    fields.push_back(arrow::field("timestamp", arrow::int64(), false));
    fields.push_back(arrow::field("participant_a", arrow::int64(), false));
    fields.push_back(arrow::field("participant_b", arrow::int64(), false));
    for (const auto& name : FeatureRecord::feature_names()) {
        fields.push_back(arrow::field(name, arrow::float32(), false));
    }
    fields.push_back(arrow::field("label_a_win", arrow::int32(), true));
    fields.push_back(arrow::field("score_a", arrow::float32(), true));
    fields.push_back(arrow::field("score_b", arrow::float32(), true));
    return arrow::schema(fields);
}

inline arrow::Result<std::shared_ptr<arrow::Table>> to_table(
    const std::vector<FeatureRecord>& records) {
    const size_t num_features = FeatureRecord::feature_count();

    // Column-major collectors
    std::vector<std::vector<int64_t>> id_cols(4);
    std::vector<std::vector<float>> feature_cols(num_features);
    for (auto& col : feature_cols) col.reserve(records.size());

    arrow::Int32Builder label;
    arrow::FloatBuilder score_a;
    arrow::FloatBuilder score_b;

    for (const auto& r : records) {
        id_cols[0].push_back(static_cast<int64_t>(r.event_id));
        id_cols[1].push_back(static_cast<int64_t>(r.timestamp));
        id_cols[2].push_back(static_cast<int64_t>(r.participant_a));
        id_cols[3].push_back(static_cast<int64_t>(r.participant_b));

        auto values = r.feature_values();
        for (size_t c = 0; c < num_features; ++c) feature_cols[c].push_back(values[c]);

        if (r.has_label) {
            ARROW_RETURN_NOT_OK(label.Append(r.label_a_win));
            ARROW_RETURN_NOT_OK(score_a.Append(r.score_a));
            ARROW_RETURN_NOT_OK(score_b.Append(r.score_b));
        } else {
            ARROW_RETURN_NOT_OK(label.AppendNull());
            ARROW_RETURN_NOT_OK(score_a.AppendNull());
            ARROW_RETURN_NOT_OK(score_b.AppendNull());
        }
    }

    arrow::ArrayVector arrays;
    std::shared_ptr<arrow::Array> arr;

    for (const auto& col : id_cols) {
        arrow::Int64Builder b;
        ARROW_RETURN_NOT_OK(b.AppendValues(col.data(), static_cast<int64_t>(col.size())));
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }

    for (const auto& col : feature_cols) {
        arrow::FloatBuilder b;
        ARROW_RETURN_NOT_OK(b.AppendValues(col.data(), static_cast<int64_t>(col.size())));
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }

    ARROW_RETURN_NOT_OK(label.Finish(&arr));
    arrays.push_back(arr);
    ARROW_RETURN_NOT_OK(score_a.Finish(&arr));
    arrays.push_back(arr);
    ARROW_RETURN_NOT_OK(score_b.Finish(&arr));
    arrays.push_back(arr);

    return arrow::Table::Make(feature_schema(), arrays, static_cast<int64_t>(records.size()));
}

inline arrow::Status write_parquet(const std::vector<FeatureRecord>& records,
                                   const std::string& path) {
    ARROW_ASSIGN_OR_RAISE(auto table, to_table(records));
    ARROW_ASSIGN_OR_RAISE(auto outfile, arrow::io::FileOutputStream::Open(path));

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(records.size()));
    ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(),
                                                   outfile, chunk_size, props));
    return outfile->Close();
}

}  // namespace parquet_export
