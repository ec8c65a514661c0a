#pragma once

#if defined(__clang__) && defined(__clang_minor__)
#define MTC_CLANG (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) && defined(__GNUC_MINOR__) && defined(__GNUC_PATCHLEVEL__)
#define MTC_GCC (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#endif

#if defined(__GNUC__)
#define MTC_LIKELY(x) (__builtin_expect(!!(x), 1))
#define MTC_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define MTC_LIKELY(x) (!!(x))
#define MTC_UNLIKELY(x) (!!(x))
#endif

#define MTC_STRINGIFY(x) #x
#define MTC_VER_STRING(major, minor, patch) MTC_STRINGIFY(major) "." MTC_STRINGIFY(minor) "." MTC_STRINGIFY(patch)

#ifdef MTC_CLANG
#define MTC_COMPILER_NAME "clang"
#define MTC_COMPILER_VERSION \
  MTC_COMPILER_NAME " " MTC_VER_STRING(__clang_major__, __clang_minor__, __clang_patchlevel__)
#elif defined(__GNUC__)
#define MTC_COMPILER_NAME "g++"
#define MTC_COMPILER_VERSION MTC_COMPILER_NAME " " MTC_VER_STRING(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#else
#error "Unknown compiler. Only clang and gcc are supported."
#endif

// Defined by the build system
#ifndef MTC_VERSION
#define MTC_VERSION "0.0.0"
#endif
