/**
 * @file execute_request.hpp
 * @brief The `{code, projectId, meetingId?, userId?}` request envelope
 * 
 * @date 2025
 */

#pragma once

#include "capsule/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace capsule {
namespace core {

/**
 * @class RequestError
 * @brief Envelope is missing required fields or has mistyped ones
 */
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct ExecuteRequest
 * @brief One program plus the context it runs under
 */
struct ExecuteRequest {
    std::string code;            ///< Program body
    ExecutionContext context;    ///< Scope identifiers
};

/**
 * @brief Parse a request envelope
 * 
 * `code` and `projectId` must be non-empty strings; `meetingId` and
 * `userId` may be absent, null or strings.
 * 
 * @throws RequestError "Missing required fields: code, projectId" when
 *         either required field is missing, or a type error message
 */
ExecuteRequest ParseExecuteRequest(const nlohmann::json& body);

/// Inverse of ParseExecuteRequest
nlohmann::json ToJson(const ExecuteRequest& request);

} // namespace core
} // namespace capsule
