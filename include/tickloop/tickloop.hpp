#pragma once

/**
 * @file
 * @brief Convenience umbrella header for tickloop.
 */

#include "tickloop/core/error.hpp"
#include "tickloop/core/reason.hpp"
#include "tickloop/core/result.hpp"
#include "tickloop/core/unique_fd.hpp"

#include "tickloop/io/multiplexer.hpp"

#include "tickloop/runtime/error_sink.hpp"
#include "tickloop/runtime/loop.hpp"
#include "tickloop/runtime/reactor.hpp"
#include "tickloop/runtime/scheduler.hpp"

#include "tickloop/async/deferred.hpp"
#include "tickloop/async/promise.hpp"
#include "tickloop/async/task.hpp"
#include "tickloop/async/timers.hpp"
