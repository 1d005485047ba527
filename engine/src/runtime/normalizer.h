#pragma once

#include <cstdint>

#include <nlohmann/json_fwd.hpp>

#include "policy/runtime_options.h"
#include "runtime/result.h"

namespace widget_script {

/**
 * Validate a script's raw return value against the ScriptOutput schema.
 *
 * - text:  `value` must be a primitive; numbers and booleans are coerced
 * - list:  `items` must be an array of objects, each with a primitive `value`
 * - shape: `shape` must name a ShapeKind
 *
 * Anything else (unknown or missing `type`, non-object) yields an
 * OutputValidationError. Serialized outputs larger than max_output_bytes
 * are rejected too. The raw value is never forwarded as output.
 */
ScriptRuntimeResult NormalizeOutput(const nlohmann::json& raw,
                                    int64_t max_output_bytes = kDefaultMaxOutputBytes);

}  // namespace widget_script
