/**
 * @file result_json.cpp
 * @brief JSON serialization of validation results
 */

#include "fluentval/validation/result_json.h"

namespace fluentval::validation {

Json::Value toJson(const ValidationFailure& failure) {
    Json::Value json;
    json["propertyName"] = failure.propertyName;
    json["errorMessage"] = failure.errorMessage;
    json["attemptedValue"] = failure.attemptedValue;
    json["errorCode"] = failure.errorCode;
    json["severity"] = severityToString(failure.severity);
    return json;
}

Json::Value toJson(const ValidationResult& result) {
    Json::Value json;
    json["isValid"] = result.isValid();

    Json::Value errors(Json::arrayValue);
    for (const auto& failure : result.errors()) {
        errors.append(toJson(failure));
    }
    json["errors"] = errors;

    return json;
}

std::string toJsonString(const ValidationResult& result) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(result));
}

} // namespace fluentval::validation
