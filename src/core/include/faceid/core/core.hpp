#pragma once

#include <utility>

// Debug break functionality
#ifdef FACEID_ENABLE_ASSERTS

#if defined(_MSC_VER)
#define FACEID_DEBUG_BREAK() __debugbreak()

#elif defined(__arm64__) && defined(__APPLE__)
#include <unistd.h>
#include <csignal>
#define FACEID_DEBUG_BREAK() ::kill(::getpid(), SIGINT)

#elif (defined(__aarch64__) || defined(__arm64__)) && (defined(__GNUC__) || defined(__clang__))
#define FACEID_DEBUG_BREAK() __asm__("brk 0")

#elif (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
#define FACEID_DEBUG_BREAK() __asm__("int3")

#elif defined(__has_builtin) && __has_builtin(__builtin_trap)
#define FACEID_DEBUG_BREAK() __builtin_trap()

#else
#include <csignal>
#define FACEID_DEBUG_BREAK() ::std::raise(SIGTRAP)

#endif

#else
#define FACEID_DEBUG_BREAK()
#endif

#define FACEID_UNREACHABLE() std::unreachable()

// Stringify macros
#define FACEID_STRINGIFY_IMPL(x) #x
#define FACEID_STRINGIFY(x) FACEID_STRINGIFY_IMPL(x)

// Concatenation macros
#define FACEID_CONCAT_IMPL(a, b) a##b
#define FACEID_CONCAT(a, b) FACEID_CONCAT_IMPL(a, b)

// Anonymous variable generation
#define FACEID_ANONYMOUS_VAR(prefix) FACEID_CONCAT(prefix, __LINE__)

// Compiler-specific branch prediction hints
#if defined(__GNUC__) || defined(__clang__)
#define FACEID_EXPECT_TRUE(x) __builtin_expect(!!(x), 1)
#define FACEID_EXPECT_FALSE(x) __builtin_expect(!!(x), 0)
#else
#define FACEID_EXPECT_TRUE(x) (x)
#define FACEID_EXPECT_FALSE(x) (x)
#endif
