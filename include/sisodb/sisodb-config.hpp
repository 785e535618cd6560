#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(BUILD_SHARED_LIBS)
    #if defined(SISODB_EXPORTS)
      #define S_EXPORT __declspec(dllexport)
    #else
      #define S_EXPORT __declspec(dllimport)
    #endif
  #else
    #define S_EXPORT
  #endif
#elif defined(__linux__) || defined(__APPLE__)
  #define S_EXPORT __attribute__((visibility("default")))
#else
#error "I don't know how to export symbols for your platform..."
#endif
