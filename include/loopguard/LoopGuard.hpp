#pragma once

/**
 * LoopGuard - therapy setting guardrails for automated insulin delivery
 *
 * Computes absolute and recommended bounds for suspend threshold,
 * correction range and its overrides, insulin sensitivity, carb ratio,
 * basal rate, maximum basal rate and maximum bolus.
 */

// Core types
#include "GuardrailPolicy.hpp"
#include "GuardrailError.hpp"
#include "Log.hpp"
#include "Quantity.hpp"
#include "ClosedRange.hpp"
#include "Guardrail.hpp"
#include "DiscreteValues.hpp"

// Settings inputs
#include "settings/GlucoseThreshold.hpp"
#include "settings/GlucoseRangeSchedule.hpp"
#include "settings/CorrectionRangeOverrides.hpp"

// Derivation
#include "Guardrails.hpp"
#include "ApiSchema.hpp"
#include "Cli.hpp"
