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

#include "boosting_ingest/dataset/row_converter.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/tabular_row.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace dataset {
namespace {

std::string RowTypesToString(const TabularRow& row) {
  return absl::StrJoin(row, ", ", [](std::string* out, const Cell& cell) {
    absl::StrAppend(out, CellTypeName(cell));
  });
}

absl::Status SchemaMismatch(const RowSchema schema, const TabularRow& row,
                            absl::string_view details) {
  return absl::InvalidArgumentError(absl::StrCat(
      "Row schema mismatch: Expecting a row with schema ",
      RowSchemaName(schema), ". Got a row with ", row.size(), " cell(s) (",
      RowTypesToString(row), "). ", details));
}

// Gets the cell "cell_idx" of type "T".
template <typename T>
absl::StatusOr<const T*> GetCell(const RowSchema schema, const TabularRow& row,
                                 const int cell_idx,
                                 absl::string_view cell_name) {
  const T* value = std::get_if<T>(&row[cell_idx]);
  if (value == nullptr) {
    return SchemaMismatch(
        schema, row,
        absl::StrCat("The ", cell_name, " cell #", cell_idx,
                     " has an unexpected type ", CellTypeName(row[cell_idx])));
  }
  return value;
}

}  // namespace

int NumCells(const RowSchema schema) {
  switch (schema) {
    case RowSchema::kWithGroup:
      return 5;
    case RowSchema::kWithoutGroup:
      return 4;
  }
  return 0;
}

absl::string_view RowSchemaName(const RowSchema schema) {
  switch (schema) {
    case RowSchema::kWithGroup:
      return "(label, features, weight, group, base_margin)";
    case RowSchema::kWithoutGroup:
      return "(label, features, weight, base_margin)";
  }
  return "UNKNOWN";
}

absl::StatusOr<RowSchema> ResolveRowSchema(
    const proto::ColumnSelection& columns) {
  if (columns.label().empty()) {
    return absl::InvalidArgumentError(
        "Invalid column selection: The label column is not specified.");
  }
  if (columns.features().empty()) {
    return absl::InvalidArgumentError(
        "Invalid column selection: The features column is not specified.");
  }
  if (columns.has_group() && !columns.group().empty()) {
    return RowSchema::kWithGroup;
  }
  return RowSchema::kWithoutGroup;
}

absl::StatusOr<LabeledPoint> ConvertRow(const RowSchema schema,
                                        const TabularRow& row) {
  if (static_cast<int>(row.size()) != NumCells(schema)) {
    return SchemaMismatch(schema, row, "Wrong number of cells.");
  }

  int cell_idx = 0;
  ASSIGN_OR_RETURN(const float* label,
                   GetCell<float>(schema, row, cell_idx++, "label"));
  ASSIGN_OR_RETURN(const FeatureVector* features,
                   GetCell<FeatureVector>(schema, row, cell_idx++, "features"));
  ASSIGN_OR_RETURN(const float* weight,
                   GetCell<float>(schema, row, cell_idx++, "weight"));
  const int32_t* group = nullptr;
  if (schema == RowSchema::kWithGroup) {
    ASSIGN_OR_RETURN(group, GetCell<int32_t>(schema, row, cell_idx++, "group"));
  }
  ASSIGN_OR_RETURN(const float* base_margin,
                   GetCell<float>(schema, row, cell_idx++, "base_margin"));

  LabeledPoint point = ToLabeledPoint(*features, *label);
  point.weight = *weight;
  if (group) {
    point.group = *group;
  }
  if (!std::isnan(*base_margin)) {
    point.base_margin = *base_margin;
  }
  return point;
}

absl::StatusOr<LabeledPoint> ConvertRow(const TabularRow& row) {
  const int num_cells = static_cast<int>(row.size());
  if (num_cells == NumCells(RowSchema::kWithGroup)) {
    return ConvertRow(RowSchema::kWithGroup, row);
  }
  if (num_cells == NumCells(RowSchema::kWithoutGroup)) {
    return ConvertRow(RowSchema::kWithoutGroup, row);
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Row schema mismatch: Got a row with ", row.size(), " cell(s) (",
      RowTypesToString(row), "). Expecting a row with schema ",
      RowSchemaName(RowSchema::kWithGroup), " or ",
      RowSchemaName(RowSchema::kWithoutGroup), "."));
}

}  // namespace dataset
}  // namespace boosting_ingest
