#pragma once

#ifdef _WIN32
  #if defined(KADDHT_EXPORT_DLL)
    #define KADDHT_API __declspec(dllexport)
  #elif defined(KADDHT_IMPORT_DLL)
    #define KADDHT_API __declspec(dllimport)
  #else
    #define KADDHT_API
  #endif
#else
  #if __GNUC__ >= 4
    #define KADDHT_API __attribute__((visibility("default")))
  #else
    #define KADDHT_API
  #endif
#endif
