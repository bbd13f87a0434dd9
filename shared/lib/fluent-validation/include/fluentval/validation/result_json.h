/**
 * @file result_json.h
 * @brief JSON serialization of validation results for API responses
 *
 * Output shape:
 * @code
 *   {
 *     "isValid": false,
 *     "errors": [
 *       { "propertyName": "Id", "errorMessage": "...", "attemptedValue": "0",
 *         "errorCode": "InclusiveBetweenValidator", "severity": "Error" }
 *     ]
 *   }
 * @endcode
 */

#pragma once

#include <string>
#include <json/json.h>
#include "validation_result.h"

namespace fluentval::validation {

Json::Value toJson(const ValidationFailure& failure);

Json::Value toJson(const ValidationResult& result);

/// @brief Compact single-line JSON text
std::string toJsonString(const ValidationResult& result);

} // namespace fluentval::validation
