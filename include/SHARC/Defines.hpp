#pragma once

#ifndef SHARC_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(SHARC_SHARED_BUILD)
#define SHARC_API __declspec(dllexport)
#elif defined(SHARC_SHARED)
#define SHARC_API __declspec(dllimport)
#else
#define SHARC_API
#endif
#else
#if defined(SHARC_SHARED_BUILD) || defined(SHARC_SHARED)
#define SHARC_API __attribute__((visibility("default")))
#else
#define SHARC_API
#endif
#endif
#endif
