/**
 * @file value_marshal.hpp
 * @brief Conversions between QuickJS values and self-contained text
 * 
 * Everything that crosses the isolation boundary goes through here as JSON
 * text: arguments are stringified inside the sandbox and parsed on the
 * host, results are dumped on the host and parsed inside the sandbox. No
 * JSValue ever leaves the runner thread and no host object is ever wrapped
 * into the sandbox.
 * 
 * @date 2025
 */

#pragma once

extern "C" {
#include <quickjs.h>
}

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace capsule {
namespace bridge {

/**
 * @class MarshalError
 * @brief A sandbox value could not be serialized (cycles, BigInt, ...)
 */
class MarshalError : public std::runtime_error {
public:
    explicit MarshalError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief JSON.stringify a sandbox value
 * @return JSON text; "null" for values JSON cannot represent (undefined, functions)
 * @throws MarshalError if stringification throws
 */
std::string StringifyValue(JSContext* ctx, JSValueConst value);

/**
 * @brief Parse JSON text into a fresh sandbox value
 * @return New value owned by the caller, or JS_EXCEPTION
 */
JSValue ParseJsonText(JSContext* ctx, const std::string& text);

/**
 * @brief Deep-copy call arguments into a host-side JSON array
 * @throws MarshalError if any argument cannot be serialized
 */
nlohmann::json MarshalArguments(JSContext* ctx, int argc, JSValueConst* argv);

/**
 * @brief Message of a thrown value
 * 
 * Uses the `message` property when the value has one, otherwise the
 * value's string conversion.
 * 
 * @param with_name Prefix with the error's `name` ("SyntaxError: ...")
 */
std::string DescribeError(JSContext* ctx, JSValueConst error, bool with_name);

/**
 * @brief Take the context's pending exception and describe it
 */
std::string TakeException(JSContext* ctx, bool with_name);

/**
 * @brief Copy a JS string (or string conversion) into a std::string
 * 
 * This is also the text of one `log` argument: `[1,'x']` prints `1,x`,
 * objects print `[object Object]`. Clears any exception raised by the
 * conversion.
 */
std::string ToStdString(JSContext* ctx, JSValueConst value);

} // namespace bridge
} // namespace capsule
