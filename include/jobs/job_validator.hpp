#pragma once

#include "common/sync_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Turns untyped job payloads into a Job. Throws ValidationError.
class JobValidator {
public:
    static Job fromJson(const nlohmann::json& payload);
    static Job fromString(const std::string& text);

    static void validate(const Job& job);
    static bool isValidJobId(const std::string& id);

    static constexpr size_t MAX_JOB_ID_LENGTH = 128;
    static constexpr int64_t MAX_INTERVAL_MINUTES = 366LL * 24 * 60;
};
