#pragma once

/// \file ad.hpp
/// \brief Umbrella header for the forward-mode differentiation engine.

#include "ad_errors.hpp"
#include "dual.hpp"
#include "evaluator.hpp"
#include "gradient.hpp"
#include "ir.hpp"
#include "op.hpp"
#include "registry.hpp"
#include "rule.hpp"
#include "transform.hpp"
