#pragma once

#include "runtime/resource/core/task_record.h"

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docket {

/// @brief Field names shared by the JSON shape and the Redis hash layout
namespace record_fields {
    inline constexpr const char* kId = "id";
    inline constexpr const char* kStatus = "status";
    inline constexpr const char* kCreatedAt = "created_at";
    inline constexpr const char* kUpdatedAt = "updated_at";
    inline constexpr const char* kResult = "result";
    inline constexpr const char* kError = "error";
}

using FieldList = std::vector<std::pair<std::string, std::string>>;
using FieldMap = std::unordered_map<std::string, std::string>;

/// @brief External shape: {id, status, created_at, updated_at, result?, error?}
/// Absent result/error are omitted, never rendered as null
Json::Value toJson(const TaskRecord& record);

std::optional<TaskRecord> fromJson(const Json::Value& value);

/// @brief One text field per record field; numbers as decimal text, result as compact JSON
FieldList toFields(const TaskRecord& record);

/// @brief Rebuild a record from hash fields
/// @return Empty if a required field is missing or malformed, or the record is inconsistent
std::optional<TaskRecord> fromFields(const FieldMap& fields);

/// @brief Seconds since epoch as fixed-point text with microsecond precision
std::string formatTimestamp(double seconds);

std::optional<double> parseTimestamp(std::string_view text);

/// @brief Compact single-line JSON text
std::string writeJson(const Json::Value& value);

/// @brief Parse JSON text
/// @param errors Receives the parser message on failure (optional)
std::optional<Json::Value> parseJson(std::string_view text, std::string* errors = nullptr);

} // namespace docket
