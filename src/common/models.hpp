#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace cassette {

struct Project {
    std::string id;
    int number = 0;
    std::string title;
    std::string url;
};

struct ProjectFieldOption {
    std::string id;
    std::string name;
};

struct ProjectField {
    std::string id;
    std::string name;
    std::string dataType;
    std::vector<ProjectFieldOption> options;
};

// One captured call. Never modified after it is appended to a Snapshot.
struct ApiCall {
    std::string method;
    std::string url;
    std::string requestBody;
    int statusCode = 0;
    std::string response;
    std::chrono::system_clock::time_point timestamp;
};

// The interaction log of one test scenario. Call order is the replay contract.
struct Snapshot {
    std::string testName;
    std::vector<ApiCall> calls;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point updated;
};

} // namespace cassette
