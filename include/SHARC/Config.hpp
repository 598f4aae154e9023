/// @file Config.hpp
/// @brief Compile-time configuration and capability macros for SHARC.
#pragma once

// Synchronous backend identifiers (compile-time selection of `DefaultSyncBackend`).
#define SHARC_SYNC_BACKEND_THREAD_SAFE 1
#define SHARC_SYNC_BACKEND_SINGLE_THREAD 2

// WebAssembly builds without the threads proposal have no OS threads to block; they default to the
// single-threaded borrow-checked backend. Every other target defaults to the thread-safe backend.
#ifndef SHARC_SYNC_BACKEND
#if (defined(__EMSCRIPTEN__) || defined(__wasm__)) && !defined(__EMSCRIPTEN_PTHREADS__) && !defined(__wasm_atomics__)
#define SHARC_SYNC_BACKEND SHARC_SYNC_BACKEND_SINGLE_THREAD
#else
#define SHARC_SYNC_BACKEND SHARC_SYNC_BACKEND_THREAD_SAFE
#endif
#endif

#if SHARC_SYNC_BACKEND != SHARC_SYNC_BACKEND_THREAD_SAFE && SHARC_SYNC_BACKEND != SHARC_SYNC_BACKEND_SINGLE_THREAD
#error "SHARC_SYNC_BACKEND must be SHARC_SYNC_BACKEND_THREAD_SAFE or SHARC_SYNC_BACKEND_SINGLE_THREAD"
#endif

// The suspending backend and every async accessor need C++20 coroutines.
#ifndef SHARC_ENABLE_ASYNC
#if defined(__cpp_impl_coroutine)
#define SHARC_ENABLE_ASYNC 1
#else
#define SHARC_ENABLE_ASYNC 0
#endif
#endif

#if SHARC_ENABLE_ASYNC && !defined(__cpp_impl_coroutine)
#error "SHARC_ENABLE_ASYNC requires compiler support for coroutines"
#endif
