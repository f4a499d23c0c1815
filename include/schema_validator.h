#pragma once

#include "errors.h"
#include <nlohmann/json.hpp>

namespace voxgate {

/**
 * @brief Check tool arguments against a JSON-Schema subset
 *
 * Supported keywords: type (object, string, number, integer, boolean,
 * array, null), properties, required, additionalProperties (boolean),
 * enum, items, minLength, maxLength. Unsupported keywords are ignored.
 *
 * @return InvalidArgs naming the first offending path
 */
VoidResult validate_arguments(const nlohmann::json& schema, const nlohmann::json& args);

} // namespace voxgate
