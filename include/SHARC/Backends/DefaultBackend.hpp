/// @file DefaultBackend.hpp
/// @brief Build-time selection of the synchronous backend used by `Shared<T>` and `SharedAny<T>`.
#pragma once

#include <SHARC/Config.hpp>

#if SHARC_SYNC_BACKEND == SHARC_SYNC_BACKEND_THREAD_SAFE
#include <SHARC/Backends/ThreadSafeBackend.hpp>
#else
#include <SHARC/Backends/SingleThreadBackend.hpp>
#endif

namespace SHARC
{
#if SHARC_SYNC_BACKEND == SHARC_SYNC_BACKEND_THREAD_SAFE
    using DefaultSyncBackend = ThreadSafeBackend;
#else
    using DefaultSyncBackend = SingleThreadBackend;
#endif
}// namespace SHARC
