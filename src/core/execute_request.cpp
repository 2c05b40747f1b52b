/**
 * @file execute_request.cpp
 * @brief Parsing of the request envelope
 * 
 * @date 2025
 */

#include "capsule/core/execute_request.hpp"

using json = nlohmann::json;

namespace capsule {
namespace core {

namespace {

const char* MISSING_FIELDS = "Missing required fields: code, projectId";

std::string RequiredString(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        throw RequestError(MISSING_FIELDS);
    }
    if (!it->is_string()) {
        throw RequestError(std::string("Field '") + key + "' must be a string");
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        throw RequestError(MISSING_FIELDS);
    }
    return value;
}

std::optional<std::string> OptionalString(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw RequestError(std::string("Field '") + key + "' must be a string or null");
    }
    return it->get<std::string>();
}

} // namespace

ExecuteRequest ParseExecuteRequest(const json& body) {
    if (!body.is_object()) {
        throw RequestError(MISSING_FIELDS);
    }

    ExecuteRequest request;
    request.code = RequiredString(body, "code");
    request.context.project_id = RequiredString(body, "projectId");
    request.context.meeting_id = OptionalString(body, "meetingId");
    request.context.user_id = OptionalString(body, "userId");
    return request;
}

json ToJson(const ExecuteRequest& request) {
    json j;
    j["code"] = request.code;
    j["projectId"] = request.context.project_id;
    j["meetingId"] = request.context.meeting_id ? json(*request.context.meeting_id) : json(nullptr);
    j["userId"] = request.context.user_id ? json(*request.context.user_id) : json(nullptr);
    return j;
}

} // namespace core
} // namespace capsule
