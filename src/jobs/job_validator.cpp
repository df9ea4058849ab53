#include "jobs/job_validator.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <cstdint>
#include <optional>

using json = nlohmann::json;

namespace {

std::string requireString(const json& payload, const char* key, const char* alias = nullptr) {
    const char* found = nullptr;
    if (payload.contains(key)) {
        found = key;
    } else if (alias != nullptr && payload.contains(alias)) {
        found = alias;
    }
    if (found == nullptr) {
        throw ValidationError(std::string("missing field '") + key + "'");
    }
    const json& value = payload.at(found);
    if (!value.is_string()) {
        throw ValidationError(std::string("field '") + found + "' must be a string");
    }
    return value.get<std::string>();
}

bool optionalBool(const json& object, const char* key, bool fallback) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return fallback;
    }
    if (!object.at(key).is_boolean()) {
        throw ValidationError(std::string("field 'schedule.") + key + "' must be a boolean");
    }
    return object.at(key).get<bool>();
}

int64_t intervalValue(const json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw ValidationError(std::string("field '") + field + "' must be an integer number of minutes");
    }
    return value.get<int64_t>();
}

// Accepts {"schedule": {...}} and the flat "scheduleInterval" minutes field.
std::optional<JobSchedule> parseSchedule(const json& payload) {
    std::optional<JobSchedule> schedule;
    if (payload.contains("schedule") && !payload.at("schedule").is_null()) {
        const json& object = payload.at("schedule");
        if (!object.is_object()) {
            throw ValidationError("field 'schedule' must be an object");
        }
        JobSchedule parsed;
        parsed.enabled = optionalBool(object, "enabled", false);
        parsed.runOnMount = optionalBool(object, "runOnMount", false);
        if (object.contains("intervalMinutes") && !object.at("intervalMinutes").is_null()) {
            parsed.intervalMinutes = intervalValue(object.at("intervalMinutes"), "schedule.intervalMinutes");
        }
        schedule = parsed;
    }
    if (payload.contains("scheduleInterval") && !payload.at("scheduleInterval").is_null()) {
        int64_t minutes = intervalValue(payload.at("scheduleInterval"), "scheduleInterval");
        if (!schedule) {
            schedule = JobSchedule{};
            schedule->enabled = minutes > 0;
        }
        if (schedule->intervalMinutes == 0) {
            schedule->intervalMinutes = minutes;
        }
    }
    return schedule;
}

} // namespace

bool JobValidator::isValidJobId(const std::string& id) {
    if (id.empty() || id.size() > MAX_JOB_ID_LENGTH || id.find("..") != std::string::npos) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

void JobValidator::validate(const Job& job) {
    if (!isValidJobId(job.id)) {
        throw ValidationError("invalid job id '" + job.id + "'");
    }
    if (job.source.empty()) {
        throw ValidationError("source must not be empty");
    }
    if (job.destination.empty()) {
        throw ValidationError("destination must not be empty");
    }
    if (job.source.find('\0') != std::string::npos || job.destination.find('\0') != std::string::npos) {
        throw ValidationError("paths must not contain NUL characters");
    }
    for (const auto& pattern : job.excludePatterns) {
        if (pattern.find('\0') != std::string::npos) {
            throw ValidationError("exclude patterns must not contain NUL characters");
        }
    }
    if (job.schedule) {
        if (job.schedule->intervalMinutes < 0 || job.schedule->intervalMinutes > MAX_INTERVAL_MINUTES) {
            throw ValidationError("schedule interval must be between 0 and " +
                                  std::to_string(MAX_INTERVAL_MINUTES) + " minutes");
        }
    }
}

Job JobValidator::fromJson(const json& payload) {
    if (!payload.is_object()) {
        throw ValidationError("job payload must be a JSON object");
    }

    Job job;
    job.id = requireString(payload, "id");
    job.source = requireString(payload, "source", "sourcePath");
    job.destination = requireString(payload, "destination", "destPath");

    std::string mode = requireString(payload, "mode");
    if (!parseSyncMode(mode, job.mode)) {
        throw ValidationError("unknown sync mode '" + mode + "'");
    }

    if (payload.contains("name") && !payload.at("name").is_null()) {
        if (!payload.at("name").is_string()) {
            throw ValidationError("field 'name' must be a string");
        }
        job.name = payload.at("name").get<std::string>();
    }
    if (job.name.empty()) {
        job.name = job.id;
    }

    if (payload.contains("excludePatterns") && !payload.at("excludePatterns").is_null()) {
        const json& patterns = payload.at("excludePatterns");
        if (!patterns.is_array()) {
            throw ValidationError("field 'excludePatterns' must be an array of strings");
        }
        for (const auto& pattern : patterns) {
            if (!pattern.is_string()) {
                throw ValidationError("field 'excludePatterns' must be an array of strings");
            }
            job.excludePatterns.push_back(pattern.get<std::string>());
        }
    }

    job.schedule = parseSchedule(payload);

    validate(job);
    return job;
}

Job JobValidator::fromString(const std::string& text) {
    json payload;
    try {
        payload = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("malformed JSON: ") + e.what());
    }
    return fromJson(payload);
}
