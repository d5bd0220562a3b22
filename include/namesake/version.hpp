/*
 * Fallback version macros for namesake.
 *
 * The build defines these on the command line from the project version. The
 * values below only keep the header usable outside that build.
 */

#pragma once

#ifndef NAMESAKE_VERSION_MAJOR
#define NAMESAKE_VERSION_MAJOR 0
#endif

#ifndef NAMESAKE_VERSION_MINOR
#define NAMESAKE_VERSION_MINOR 0
#endif

#ifndef NAMESAKE_VERSION_PATCH
#define NAMESAKE_VERSION_PATCH 0
#endif

#ifndef NAMESAKE_VERSION_STRING
#define NAMESAKE_VERSION_STRING "0.0.0+dev"
#endif
