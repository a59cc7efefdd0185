#include "runtime/resource/core/task_id.h"

#include <array>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <random>

namespace docket {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Dash positions in the 36-char canonical form
constexpr std::array<size_t, 4> kDashPositions{8, 13, 18, 23};

bool isDashPosition(size_t index)
{
    for (size_t pos : kDashPositions)
    {
        if (pos == index)
        {
            return true;
        }
    }
    return false;
}

} // namespace

TaskId TaskId::generate()
{
    static std::mutex generatorMutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(generatorMutex);
        high = gen();
        low = gen();
    }

    // Version 4 in the high nibble of byte 6, variant 10xx in byte 8
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string text;
    text.reserve(36);

    auto appendHex = [&text](uint64_t value, int nibbles, int shiftFrom) {
        for (int i = 0; i < nibbles; ++i)
        {
            const int shift = shiftFrom - 4 * i;
            text += kHexDigits[(value >> shift) & 0xF];
        }
    };

    appendHex(high, 8, 60);
    text += '-';
    appendHex(high, 4, 28);
    text += '-';
    appendHex(high, 4, 12);
    text += '-';
    appendHex(low, 4, 60);
    text += '-';
    appendHex(low, 12, 44);

    return TaskId(std::move(text));
}

std::optional<TaskId> TaskId::fromString(std::string_view text)
{
    if (text.size() != 36)
    {
        return std::nullopt;
    }

    std::string normalized;
    normalized.reserve(36);

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (isDashPosition(i))
        {
            if (c != '-')
            {
                return std::nullopt;
            }
            normalized += c;
            continue;
        }

        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            return std::nullopt;
        }
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return TaskId(std::move(normalized));
}

} // namespace docket
