/**
 * @file value_marshal.cpp
 * @brief Implementation of boundary conversions
 * 
 * @date 2025
 */

#include "capsule/bridge/value_marshal.hpp"

using json = nlohmann::json;

namespace capsule {
namespace bridge {

namespace {

void ClearException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    JS_FreeValue(ctx, exception);
}

std::string PropertyString(JSContext* ctx, JSValueConst object, const char* name) {
    JSValue value = JS_GetPropertyStr(ctx, object, name);
    if (JS_IsException(value)) {
        ClearException(ctx);
        return "";
    }
    std::string text = JS_IsUndefined(value) || JS_IsNull(value) ? "" : ToStdString(ctx, value);
    JS_FreeValue(ctx, value);
    return text;
}

} // namespace

std::string ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(ctx, &length, value);
    if (!text) {
        ClearException(ctx);
        return "[unprintable value]";
    }
    std::string result(text, length);
    JS_FreeCString(ctx, text);
    return result;
}

std::string StringifyValue(JSContext* ctx, JSValueConst value) {
    JSValue text = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(text)) {
        throw MarshalError("Value cannot be serialized: " + TakeException(ctx, false));
    }
    if (JS_IsUndefined(text)) {
        return "null";
    }
    std::string result = ToStdString(ctx, text);
    JS_FreeValue(ctx, text);
    return result;
}

JSValue ParseJsonText(JSContext* ctx, const std::string& text) {
    return JS_ParseJSON(ctx, text.c_str(), text.size(), "<capability result>");
}

json MarshalArguments(JSContext* ctx, int argc, JSValueConst* argv) {
    json args = json::array();
    for (int i = 0; i < argc; ++i) {
        std::string text = StringifyValue(ctx, argv[i]);
        try {
            args.push_back(json::parse(text));
        }
        catch (const json::exception& e) {
            throw MarshalError("Argument " + std::to_string(i + 1) + " is not valid JSON: " + e.what());
        }
    }
    return args;
}

std::string DescribeError(JSContext* ctx, JSValueConst error, bool with_name) {
    if (!JS_IsObject(error)) {
        return ToStdString(ctx, error);
    }

    JSValue message_value = JS_GetPropertyStr(ctx, error, "message");
    bool has_message = !JS_IsException(message_value) && !JS_IsUndefined(message_value);
    if (JS_IsException(message_value)) {
        ClearException(ctx);
    }
    JS_FreeValue(ctx, message_value);

    if (!has_message) {
        return ToStdString(ctx, error);
    }

    std::string message = PropertyString(ctx, error, "message");
    if (!with_name) {
        return message;
    }

    std::string name = PropertyString(ctx, error, "name");
    return name.empty() ? message : name + ": " + message;
}

std::string TakeException(JSContext* ctx, bool with_name) {
    JSValue exception = JS_GetException(ctx);
    std::string message = DescribeError(ctx, exception, with_name);
    JS_FreeValue(ctx, exception);
    return message;
}

} // namespace bridge
} // namespace capsule
