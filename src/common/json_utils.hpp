#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace cassette {

inline std::chrono::system_clock::time_point truncateToMillis(
    std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::floor<std::chrono::milliseconds>(timestamp);
}

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(timestamp);
    const auto seconds = std::chrono::floor<std::chrono::seconds>(millis);
    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis - seconds).count()
        << 'Z';
    return out.str();
}

// Accepts RFC 3339 timestamps: optional fraction (kept to milliseconds) and
// either a Z suffix or a +HH:MM / -HH:MM offset.
inline std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            const int digit = in.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    std::chrono::minutes offset{0};
    const int marker = in.get();
    if (marker == '+' || marker == '-') {
        std::string rest;
        in >> rest;
        rest.erase(std::remove(rest.begin(), rest.end(), ':'), rest.end());
        if (rest.size() != 4
            || !std::all_of(rest.begin(), rest.end(),
                            [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        offset = std::chrono::minutes(std::stoi(rest.substr(0, 2)) * 60
                                      + std::stoi(rest.substr(2, 2)));
        if (marker == '-') {
            offset = -offset;
        }
    } else if (marker != 'Z' && marker != 'z') {
        return std::nullopt;
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    // system_clock cannot represent every year (about 1677-2262 with
    // nanosecond ticks). A day of slack covers the fraction and the offset.
    constexpr std::int64_t kSlackSeconds = 24 * 60 * 60;
    const std::int64_t earliest = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::min()).count() + kSlackSeconds;
    const std::int64_t latest = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max()).count() - kSlackSeconds;
    if (static_cast<std::int64_t>(time) < earliest || static_cast<std::int64_t>(time) > latest) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time)
        + std::chrono::milliseconds(millis) - offset;
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    return parseIso8601(value).value_or(std::chrono::system_clock::time_point{});
}

inline void to_json(nlohmann::json &j, const Project &project)
{
    j = nlohmann::json{
        {"id", project.id},
        {"number", project.number},
        {"title", project.title},
        {"url", project.url}
    };
}

inline void from_json(const nlohmann::json &j, Project &project)
{
    project.id = j.value("id", "");
    project.number = j.value("number", 0);
    project.title = j.value("title", "");
    project.url = j.value("url", "");
}

inline void to_json(nlohmann::json &j, const ProjectFieldOption &option)
{
    j = nlohmann::json{{"id", option.id}, {"name", option.name}};
}

inline void from_json(const nlohmann::json &j, ProjectFieldOption &option)
{
    option.id = j.value("id", "");
    option.name = j.value("name", "");
}

inline void to_json(nlohmann::json &j, const ProjectField &field)
{
    j = nlohmann::json{
        {"id", field.id},
        {"name", field.name},
        {"dataType", field.dataType}
    };
    if (!field.options.empty()) {
        j["options"] = field.options;
    }
}

inline void from_json(const nlohmann::json &j, ProjectField &field)
{
    field.id = j.value("id", "");
    field.name = j.value("name", "");
    field.dataType = j.value("dataType", "");
    if (j.contains("options") && j.at("options").is_array()) {
        field.options = j.at("options").get<std::vector<ProjectFieldOption>>();
    } else {
        field.options.clear();
    }
}

inline void to_json(nlohmann::json &j, const ApiCall &call)
{
    j = nlohmann::json{
        {"method", call.method},
        {"url", call.url},
        {"status_code", call.statusCode},
        {"response", call.response},
        {"timestamp", toIso8601Utc(call.timestamp)}
    };
    if (!call.requestBody.empty()) {
        j["request_body"] = call.requestBody;
    }
}

// status_code is mandatory; a call without it cannot be classified on replay.
inline void from_json(const nlohmann::json &j, ApiCall &call)
{
    call.method = j.value("method", "");
    call.url = j.value("url", "");
    call.requestBody = j.value("request_body", "");
    call.statusCode = j.at("status_code").get<int>();
    if (!j.contains("response") || j.at("response").is_null()) {
        call.response.clear();
    } else if (j.at("response").is_string()) {
        call.response = j.at("response").get<std::string>();
    } else {
        call.response = j.at("response").dump();
    }
    call.timestamp = fromIso8601Utc(j.value("timestamp", ""));
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"test_name", snapshot.testName},
        {"calls", snapshot.calls},
        {"created", toIso8601Utc(snapshot.created)},
        {"updated", toIso8601Utc(snapshot.updated)}
    };
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.testName = j.value("test_name", "");
    if (j.at("calls").is_null()) {
        snapshot.calls.clear();
    } else {
        snapshot.calls = j.at("calls").get<std::vector<ApiCall>>();
    }
    snapshot.created = fromIso8601Utc(j.value("created", ""));
    snapshot.updated = fromIso8601Utc(j.value("updated", ""));
}

} // namespace cassette
