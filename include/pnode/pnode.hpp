/**
 * @file pnode.hpp
 * @brief Umbrella include for the probabilistic ODE solver.
 */
#pragma once

#include "pnode/batch.hpp"
#include "pnode/belief.hpp"
#include "pnode/calibration.hpp"
#include "pnode/controller.hpp"
#include "pnode/correction.hpp"
#include "pnode/error_norm.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/interpolation.hpp"
#include "pnode/jacobian.hpp"
#include "pnode/logging.hpp"
#include "pnode/markov.hpp"
#include "pnode/prior.hpp"
#include "pnode/smoother.hpp"
#include "pnode/solution.hpp"
#include "pnode/solver.hpp"
#include "pnode/sqrtm.hpp"
#include "pnode/state_space.hpp"
#include "pnode/taylor.hpp"
#include "pnode/types.hpp"
