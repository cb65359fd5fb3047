#pragma once

/**
 * @defgroup real Real-number models
 * @defgroup trig Trigonometric functions
 * @defgroup complex Complex numbers
 */

#include "angle.hpp"
#include "complex.hpp"
#include "complex_io.hpp"
#include "constants.hpp"
#include "decimal.hpp"
#include "gamma.hpp"
#include "hyperbolic.hpp"
#include "logging.hpp"
#include "real_traits.hpp"
#include "series.hpp"
#include "trig.hpp"
