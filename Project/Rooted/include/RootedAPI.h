#pragma once

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef ROOTED_EXPORTS
#define ROOTED_API __declspec(dllexport)
#else
#define ROOTED_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef ROOTED_EXPORTS
#define ROOTED_API __attribute__((visibility("default")))
#else
#define ROOTED_API
#endif
#endif

// Static builds export nothing.
#ifdef ROOTED_STATIC
#undef ROOTED_API
#define ROOTED_API
#endif
