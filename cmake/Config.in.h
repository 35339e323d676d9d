/* SPDX-License-Identifier: LGPL-3.0-only */

/* Build configuration, generated by CMake from cmake/Config.in.h. */
#ifndef PIDSET_CONFIG_H
#define PIDSET_CONFIG_H

#if __cplusplus >= 201103L
/* Mirrors a boolean option as pidset::config::NAME for C++ code. */
#define EXPOSE_CONFIG(NAME, VALUE)                                             \
  namespace pidset                                                             \
  {                                                                            \
  namespace config                                                             \
  {                                                                            \
  constexpr bool NAME = VALUE;                                                 \
  }                                                                            \
  }
#else /* __cplusplus < 201103L */
#define EXPOSE_CONFIG(NAME, VALUE)
#endif /* __cplusplus */

/* Whether libpidsetcore is a shared object. */
#cmakedefine01 PIDSET_BUILD_SHARED_LIBS
EXPOSE_CONFIG(BuildSharedLibs, PIDSET_BUILD_SHARED_LIBS)

/* Whether PIDSET_TRACE_LOG() statements are compiled in. */
#cmakedefine01 PIDSET_NON_ESSENTIAL_LOGS
EXPOSE_CONFIG(NonEssentialLogs, PIDSET_NON_ESSENTIAL_LOGS)

/* Name of the target platform, as detected by CMake. */
#define PIDSET_PLATFORM "${PIDSET_PLATFORM}"

/* Values of PIDSET_PLATFORM_ID. */
/* NOLINTBEGIN(modernize-macro-to-enum) */
#define PIDSET_PLATFORM_ID_Unsupported 0
#define PIDSET_PLATFORM_ID_Unix 1
/* NOLINTEND(modernize-macro-to-enum) */


/* clang-format off */
#define PIDSET_PLATFORM_ID PIDSET_PLATFORM_ID_${PIDSET_PLATFORM}
/* clang-format on */

/* Defined if PIDSET_PLATFORM_ID is PIDSET_PLATFORM_ID_Unix. */
#cmakedefine PIDSET_PLATFORM_UNIX

/* CMAKE_BUILD_TYPE, possibly empty. */
#define PIDSET_BUILD_TYPE "${CMAKE_BUILD_TYPE}"

#undef EXPOSE_CONFIG

#endif /* PIDSET_CONFIG_H */
