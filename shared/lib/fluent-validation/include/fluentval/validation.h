/**
 * @file validation.h
 * @brief Umbrella header for the fluentval validation library
 */

#pragma once

#include "validation/types.h"
#include "validation/validation_result.h"
#include "validation/validation_exception.h"
#include "validation/member_info.h"
#include "validation/comparers.h"
#include "validation/message_formatter.h"
#include "validation/validator_options.h"
#include "validation/property_validator.h"
#include "validation/comparison_validators.h"
#include "validation/range_validators.h"
#include "validation/property_rule.h"
#include "validation/rule_builder.h"
#include "validation/validator_descriptor.h"
#include "validation/abstract_validator.h"
#include "validation/result_json.h"
