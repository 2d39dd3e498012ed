#pragma once

#include <optional>
#include <string>

#include <quickjs.h>

#include "nlohmann/json.hpp"

namespace librarian::sandbox::js {

// String conversion that never leaves a pending exception behind.
std::string ToStdString(JSContext* ctx, JSValueConst value);

// "Name: message" followed by the engine's stack lines when present.
std::string DescribeException(JSContext* ctx, JSValueConst exception);

// Takes the pending exception off the context and describes it.
std::string TakeException(JSContext* ctx);

void ClearException(JSContext* ctx);

// Rendering used by print/console/FINAL: strings verbatim, errors as
// "Name: message", plain objects and arrays as two-space indented JSON,
// everything else through String(value).
std::string Stringify(JSContext* ctx, JSValueConst value);

// JSON snapshot of a script value. Empty when the value has no JSON form
// (undefined, functions) or serialisation threw; error says which.
std::optional<nlohmann::json> ToJson(JSContext* ctx, JSValueConst value, std::string* error);

// Builds a fresh script value from host JSON; never aliases host memory.
JSValue FromJson(JSContext* ctx, const nlohmann::json& value);

JSValue NewErrorWithMessage(JSContext* ctx, const std::string& message);

}  // namespace librarian::sandbox::js
