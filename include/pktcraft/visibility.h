#ifndef PKTCRAFT_VISIBILITY_H
#define PKTCRAFT_VISIBILITY_H

/*
 * PKTCRAFT_API marks every exported symbol, C++ and C alike.
 *
 * The build defines PKTCRAFT_BUILDING_DLL when pktcraft is a shared
 * library and compiles with hidden visibility; static builds leave the
 * macro empty. Plain C so pktcraft_capi.h can share it.
 */
#if defined(PKTCRAFT_BUILDING_DLL)
  #if defined(_WIN32) || defined(__CYGWIN__)
    #define PKTCRAFT_API __declspec(dllexport)
  #elif __GNUC__ >= 4
    #define PKTCRAFT_API __attribute__((visibility("default")))
  #else
    #define PKTCRAFT_API
  #endif
#else
  #define PKTCRAFT_API
#endif

#endif /* PKTCRAFT_VISIBILITY_H */
