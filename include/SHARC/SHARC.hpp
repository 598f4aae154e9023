/// @file SHARC.hpp
/// @brief Convenience header pulling in every public SHARC container and backend.
#pragma once

#include <SHARC/Config.hpp>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Access/Guards.hpp>
#include <SHARC/Backends/BackendConcept.hpp>
#include <SHARC/Backends/DefaultBackend.hpp>
#include <SHARC/Backends/SingleThreadBackend.hpp>
#include <SHARC/Backends/ThreadSafeBackend.hpp>
#include <SHARC/Containers/Container.hpp>
#include <SHARC/Containers/SharedAny.hpp>
#include <SHARC/Exceptions/AccessException.hpp>

#if SHARC_ENABLE_ASYNC
#include <SHARC/Async/Task.hpp>
#include <SHARC/Backends/SuspendingBackend.hpp>
#include <SHARC/Execution/CooperativeScheduler.hpp>
#include <SHARC/Execution/InlineScheduler.hpp>
#endif
