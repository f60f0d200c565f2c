#pragma once

// Umbrella header for the miniflow workflow runner.

#include "miniflow/action_state.hpp"
#include "miniflow/engine.hpp"
#include "miniflow/errors.hpp"
#include "miniflow/expression.hpp"
#include "miniflow/graph.hpp"
#include "miniflow/interpolator.hpp"
#include "miniflow/ledger.hpp"
#include "miniflow/loader.hpp"
#include "miniflow/logging.hpp"
#include "miniflow/params.hpp"
#include "miniflow/plugin_loader.hpp"
#include "miniflow/report.hpp"
#include "miniflow/runner.hpp"
#include "miniflow/runners/bundled.hpp"
#include "miniflow/settings.hpp"
#include "miniflow/strategy.hpp"
#include "miniflow/thread_pool.hpp"
