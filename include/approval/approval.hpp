#pragma once

/**
 * Purchase Approval Library
 *
 * Main include file - includes all public headers of the decision core.
 */

// Error types
#include "errors.hpp"

// Value types and outcomes
#include "types.hpp"

// Bounds and out-of-range handling
#include "range_policy.hpp"

// Score, capped maximum and nearest-period search
#include "offer_math.hpp"

// Customer profile source
#include "profile_store.hpp"

// Decision orchestrator
#include "decision.hpp"

// Server configuration
#include "config.hpp"
