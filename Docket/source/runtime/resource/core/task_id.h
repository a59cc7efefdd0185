#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace docket {

/// @brief Opaque identifier of a submitted task
/// Canonical lower-case RFC 4122 UUID text ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx")
class TaskId
{
public:
    TaskId() = default;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// @brief Generate a random version 4 UUID (thread-safe)
    static TaskId generate();

    /// @brief Parse canonical UUID text (upper case accepted, stored lower case)
    /// @return Empty if the text is not a canonical 8-4-4-4-12 hex UUID
    static std::optional<TaskId> fromString(std::string_view text);

    // =========================================================================
    // Validation
    // =========================================================================

    [[nodiscard]] bool isValid() const { return !m_value.empty(); }
    explicit operator bool() const { return isValid(); }

    // =========================================================================
    // Comparison
    // =========================================================================

    bool operator==(const TaskId& other) const { return m_value == other.m_value; }
    bool operator!=(const TaskId& other) const { return m_value != other.m_value; }
    bool operator<(const TaskId& other) const { return m_value < other.m_value; }

    [[nodiscard]] const std::string& str() const { return m_value; }

private:
    explicit TaskId(std::string value) : m_value(std::move(value)) {}

    std::string m_value;
};

} // namespace docket

// Specialization of std::hash for use in unordered containers
namespace std {

template<>
struct hash<docket::TaskId>
{
    size_t operator()(const docket::TaskId& id) const noexcept
    {
        return std::hash<std::string>{}(id.str());
    }
};

} // namespace std
