#pragma once

/**
 * @file sweep.hpp
 * @brief Umbrella header for the sweep library
 *
 * sweep keeps a Windows machine converged on a target software state:
 * unwanted packages removed, essential applications installed. Each run
 * collects a multi-source inventory, diffs it against the previous run's
 * snapshot, matches the new identifiers against pattern lists and drives
 * verified removal/installation.
 */

#include "sweep/command.hpp"
#include "sweep/config.hpp"
#include "sweep/diff.hpp"
#include "sweep/executor.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/inventory.hpp"
#include "sweep/matcher.hpp"
#include "sweep/methods.hpp"
#include "sweep/pipeline.hpp"
#include "sweep/platform.hpp"
#include "sweep/reporter.hpp"
#include "sweep/result.hpp"
#include "sweep/snapshot.hpp"
#include "sweep/types.hpp"
#include "sweep/warnings.hpp"
