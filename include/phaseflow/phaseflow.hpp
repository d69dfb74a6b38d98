/**
 * @file phaseflow.hpp
 * @brief Public API: RK4 trajectories and equilibrium classification for planar linear systems.
 */
#pragma once

#include "phaseflow/classifier.hpp"
#include "phaseflow/field.hpp"
#include "phaseflow/flow_line.hpp"
#include "phaseflow/format.hpp"
#include "phaseflow/integrator.hpp"
#include "phaseflow/portrait.hpp"
#include "phaseflow/presets.hpp"
#include "phaseflow/types.hpp"
