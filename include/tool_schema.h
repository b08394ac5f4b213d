#pragma once

#include "errors.h"
#include <nlohmann/json.hpp>

namespace parley {

/**
 * @brief Check tool arguments against a JSON schema
 *
 * Supports the subset tool schemas use in practice: type (object, string,
 * integer, number, boolean, array, null), required, properties, enum,
 * items, minLength/maxLength, minimum/maximum and additionalProperties:false.
 * Other keywords are ignored.
 * @return Validation error naming the offending path ("$.query", "$.tags[2]")
 */
VoidResult validate_arguments(const nlohmann::json& schema, const nlohmann::json& args);

} // namespace parley
