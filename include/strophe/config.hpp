#pragma once
#ifndef STROPHE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define STROPHE_PLATFORM_WINDOWS 1
#else
#define STROPHE_PLATFORM_WINDOWS 0
#endif
#if STROPHE_PLATFORM_WINDOWS
#if defined(STROPHE_BUILD_SHARED)
#define STROPHE_API __declspec(dllexport)
#elif defined(STROPHE_SHARED)
#define STROPHE_API __declspec(dllimport)
#else
#define STROPHE_API
#endif
#else
#if defined(STROPHE_BUILD_SHARED) || defined(STROPHE_SHARED)
#if __GNUC__ >= 4
#define STROPHE_API __attribute__((visibility("default")))
#else
#define STROPHE_API
#endif // __GNUC__
#else
#define STROPHE_API
#endif // STROPHE_BUILD_SHARED || STROPHE_SHARED
#endif // STROPHE_PLATFORM_WINDOWS
#endif // STROPHE_API

// Default name of the record property carrying a variant's tag
#ifndef STROPHE_DEFAULT_TAG_PROPERTY
#define STROPHE_DEFAULT_TAG_PROPERTY "tag"
#endif
