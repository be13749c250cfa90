/*
 * Copyright 2021 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conversion of tabular rows into labeled points.
//
// A row contains, in order:
//   label (float), features (FeatureVector), weight (float),
//   [group (int32)], base_margin (float).
//
// The group cell is present iff the column selection contains a group column.
// The layout is resolved once per dataset with "ResolveRowSchema", and each row
// is then converted with "ConvertRow".
//
// Usage example:
//   ASSIGN_OR_RETURN(const auto schema, ResolveRowSchema(columns));
//   for (const auto& row : rows) {
//     ASSIGN_OR_RETURN(auto point, ConvertRow(schema, row));
//     ...
//   }

#ifndef BOOSTING_INGEST_DATASET_ROW_CONVERTER_H_
#define BOOSTING_INGEST_DATASET_ROW_CONVERTER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/tabular_row.h"

namespace boosting_ingest {
namespace dataset {

enum class RowSchema {
  // label, features, weight, group, base_margin.
  kWithGroup,
  // label, features, weight, base_margin.
  kWithoutGroup,
};

// Number of cells of a row with the given schema.
int NumCells(RowSchema schema);

absl::string_view RowSchemaName(RowSchema schema);

// Determines the row layout produced by the selection layer for the given
// columns. Fails if the label or the features column is not specified.
absl::StatusOr<RowSchema> ResolveRowSchema(
    const proto::ColumnSelection& columns);

// Converts a row into a labeled point. Fails if the row does not exactly match
// "schema". A NaN base margin cell means that the point has no base margin.
absl::StatusOr<LabeledPoint> ConvertRow(RowSchema schema,
                                        const TabularRow& row);

// Same as above, with the schema inferred from the number of cells.
absl::StatusOr<LabeledPoint> ConvertRow(const TabularRow& row);

}  // namespace dataset
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DATASET_ROW_CONVERTER_H_
