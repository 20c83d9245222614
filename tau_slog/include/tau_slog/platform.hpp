#pragma once
#include <cstdint>

// ===== Platform detection =====
#if defined(__linux__)
    #define TAU_SLOG_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define TAU_SLOG_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define TAU_SLOG_PLATFORM_MACOS 1
#endif

// ===== Inlining / caller address =====
// Emission wrappers are forced inline so that the return address seen by the
// emitter belongs to the user's call site.
#if defined(_MSC_VER)
    #include <intrin.h>
    #define TAU_SLOG_ALWAYS_INLINE __forceinline
    #define TAU_SLOG_NOINLINE __declspec(noinline)
    #define TAU_SLOG_RETURN_ADDRESS() reinterpret_cast<std::uintptr_t>(_ReturnAddress())
#else
    #define TAU_SLOG_ALWAYS_INLINE inline __attribute__((always_inline))
    #define TAU_SLOG_NOINLINE __attribute__((noinline))
    #define TAU_SLOG_RETURN_ADDRESS() \
        reinterpret_cast<std::uintptr_t>(__builtin_return_address(0))
#endif

// ===== Captured stack depth =====
#ifndef TAU_SLOG_STACK_DEPTH
    #define TAU_SLOG_STACK_DEPTH 16
#endif

// ===== Special field prefix understood by the logging agent =====
#ifndef TAU_SLOG_FIELD_PREFIX
    #define TAU_SLOG_FIELD_PREFIX "logging.googleapis.com/"
#endif
