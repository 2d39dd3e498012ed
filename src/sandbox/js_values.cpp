#include "sandbox/js_values.hpp"

namespace librarian::sandbox::js {
namespace {

std::string GetStringProperty(JSContext* ctx, JSValueConst object, const char* name) {
    JSValue value = JS_GetPropertyStr(ctx, object, name);
    std::string text;
    if (JS_IsException(value)) {
        ClearException(ctx);
    } else if (!JS_IsUndefined(value) && !JS_IsNull(value)) {
        text = ToStdString(ctx, value);
    }
    JS_FreeValue(ctx, value);
    return text;
}

std::string DumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

void ClearException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    JS_FreeValue(ctx, exception);
}

std::string ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(ctx, &length, value);
    if (!text) {
        ClearException(ctx);
        return "[unprintable value]";
    }
    std::string out(text, length);
    JS_FreeCString(ctx, text);
    return out;
}

std::string DescribeException(JSContext* ctx, JSValueConst exception) {
    if (!JS_IsError(ctx, exception)) {
        return ToStdString(ctx, exception);
    }
    auto name = GetStringProperty(ctx, exception, "name");
    const auto message = GetStringProperty(ctx, exception, "message");
    auto stack = GetStringProperty(ctx, exception, "stack");
    if (name.empty()) {
        name = "Error";
    }
    std::string description = message.empty() ? name : name + ": " + message;
    while (!stack.empty() && (stack.back() == '\n' || stack.back() == ' ')) {
        stack.pop_back();
    }
    if (!stack.empty()) {
        description += "\n" + stack;
    }
    return description;
}

std::string TakeException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    auto description = DescribeException(ctx, exception);
    JS_FreeValue(ctx, exception);
    return description;
}

std::string Stringify(JSContext* ctx, JSValueConst value) {
    if (JS_IsString(value)) {
        return ToStdString(ctx, value);
    }
    if (JS_IsObject(value) && !JS_IsFunction(ctx, value) && !JS_IsError(ctx, value)) {
        JSValue space = JS_NewInt32(ctx, 2);
        JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, space);
        JS_FreeValue(ctx, space);
        if (JS_IsException(json)) {
            ClearException(ctx);
        } else if (JS_IsString(json)) {
            auto text = ToStdString(ctx, json);
            JS_FreeValue(ctx, json);
            return text;
        } else {
            JS_FreeValue(ctx, json);
        }
    }
    return ToStdString(ctx, value);
}

std::optional<nlohmann::json> ToJson(JSContext* ctx, JSValueConst value, std::string* error) {
    JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(json)) {
        auto description = TakeException(ctx);
        if (error) {
            *error = std::move(description);
        }
        return std::nullopt;
    }
    if (!JS_IsString(json)) {
        JS_FreeValue(ctx, json);
        if (error) {
            *error = "value has no JSON representation";
        }
        return std::nullopt;
    }
    const auto text = ToStdString(ctx, json);
    JS_FreeValue(ctx, json);
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        if (error) {
            *error = "value produced invalid JSON";
        }
        return std::nullopt;
    }
    return parsed;
}

JSValue FromJson(JSContext* ctx, const nlohmann::json& value) {
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        return JS_NewStringLen(ctx, text.data(), text.size());
    }
    const auto text = DumpJson(value);
    return JS_ParseJSON(ctx, text.c_str(), text.size(), "<host>");
}

JSValue NewErrorWithMessage(JSContext* ctx, const std::string& message) {
    JSValue error = JS_NewError(ctx);
    JS_DefinePropertyValueStr(ctx, error, "message",
                              JS_NewStringLen(ctx, message.data(), message.size()),
                              JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
    return error;
}

}  // namespace librarian::sandbox::js
