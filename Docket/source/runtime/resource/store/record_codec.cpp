#include "runtime/resource/store/record_codec.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace docket {

std::string formatTimestamp(double seconds)
{
    char buffer[64];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.6f", seconds);
    if (written <= 0)
    {
        return "0.000000";
    }
    return std::string(buffer, static_cast<size_t>(written));
}

std::optional<double> parseTimestamp(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }

    // strtod needs a terminated buffer
    const std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::string writeJson(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parseJson(std::string_view text, std::string* errors)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value value;
    std::string parseErrors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &parseErrors))
    {
        if (errors)
        {
            *errors = parseErrors;
        }
        return std::nullopt;
    }
    return value;
}

Json::Value toJson(const TaskRecord& record)
{
    Json::Value value(Json::objectValue);
    value[record_fields::kId] = record.id.str();
    value[record_fields::kStatus] = toString(record.status);
    value[record_fields::kCreatedAt] = record.createdAt;
    value[record_fields::kUpdatedAt] = record.updatedAt;

    if (record.result)
    {
        value[record_fields::kResult] = *record.result;
    }
    if (record.error)
    {
        value[record_fields::kError] = *record.error;
    }
    return value;
}

std::optional<TaskRecord> fromJson(const Json::Value& value)
{
    if (!value.isObject())
    {
        return std::nullopt;
    }

    const Json::Value& id = value[record_fields::kId];
    const Json::Value& status = value[record_fields::kStatus];
    const Json::Value& createdAt = value[record_fields::kCreatedAt];
    const Json::Value& updatedAt = value[record_fields::kUpdatedAt];

    if (!id.isString() || !status.isString() || !createdAt.isNumeric() || !updatedAt.isNumeric())
    {
        return std::nullopt;
    }

    auto taskId = TaskId::fromString(id.asString());
    auto taskStatus = parseTaskStatus(status.asString());
    if (!taskId || !taskStatus)
    {
        return std::nullopt;
    }

    TaskRecord record;
    record.id = *taskId;
    record.status = *taskStatus;
    record.createdAt = createdAt.asDouble();
    record.updatedAt = updatedAt.asDouble();

    if (value.isMember(record_fields::kResult))
    {
        record.result = value[record_fields::kResult];
    }
    if (value.isMember(record_fields::kError))
    {
        const Json::Value& error = value[record_fields::kError];
        if (!error.isString())
        {
            return std::nullopt;
        }
        record.error = error.asString();
    }

    if (!isConsistent(record))
    {
        return std::nullopt;
    }
    return record;
}

FieldList toFields(const TaskRecord& record)
{
    FieldList fields;
    fields.reserve(6);
    fields.emplace_back(record_fields::kId, record.id.str());
    fields.emplace_back(record_fields::kStatus, toString(record.status));
    fields.emplace_back(record_fields::kCreatedAt, formatTimestamp(record.createdAt));
    fields.emplace_back(record_fields::kUpdatedAt, formatTimestamp(record.updatedAt));

    if (record.result)
    {
        fields.emplace_back(record_fields::kResult, writeJson(*record.result));
    }
    if (record.error)
    {
        fields.emplace_back(record_fields::kError, *record.error);
    }
    return fields;
}

std::optional<TaskRecord> fromFields(const FieldMap& fields)
{
    auto field = [&fields](const char* name) -> const std::string* {
        auto it = fields.find(name);
        return it == fields.end() ? nullptr : &it->second;
    };

    const std::string* id = field(record_fields::kId);
    const std::string* status = field(record_fields::kStatus);
    const std::string* createdAt = field(record_fields::kCreatedAt);
    const std::string* updatedAt = field(record_fields::kUpdatedAt);
    if (!id || !status || !createdAt || !updatedAt)
    {
        return std::nullopt;
    }

    auto taskId = TaskId::fromString(*id);
    auto taskStatus = parseTaskStatus(*status);
    auto created = parseTimestamp(*createdAt);
    auto updated = parseTimestamp(*updatedAt);
    if (!taskId || !taskStatus || !created || !updated)
    {
        return std::nullopt;
    }

    TaskRecord record;
    record.id = *taskId;
    record.status = *taskStatus;
    record.createdAt = *created;
    record.updatedAt = *updated;

    if (const std::string* result = field(record_fields::kResult))
    {
        auto parsed = parseJson(*result);
        if (!parsed)
        {
            return std::nullopt;
        }
        record.result = std::move(*parsed);
    }
    if (const std::string* error = field(record_fields::kError))
    {
        record.error = *error;
    }

    if (!isConsistent(record))
    {
        return std::nullopt;
    }
    return record;
}

} // namespace docket
