// Export.hpp
// NGIN_REGISTRY_API symbol visibility for static and shared builds
#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_REGISTRY_STATIC)
    #define NGIN_REGISTRY_API
  #else
    #if defined(NGIN_REGISTRY_EXPORTS)
      #define NGIN_REGISTRY_API __declspec(dllexport)
    #else
      #define NGIN_REGISTRY_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_REGISTRY_API
#endif
