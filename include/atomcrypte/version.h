/**
 * @file version.h
 * @brief Unified Version Information for atomcrypte
 *
 * Single source of truth for library and wire-format versions.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ATOMCRYPTE_VERSION_H
#define ATOMCRYPTE_VERSION_H

/** Major version number (API breaking changes) */
#define ATOMCRYPTE_VERSION_MAJOR 0

/** Minor version number (new features, backward compatible) */
#define ATOMCRYPTE_VERSION_MINOR 7

/** Patch version number (bug fixes) */
#define ATOMCRYPTE_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define ATOMCRYPTE_VERSION_STRING "0.7.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define ATOMCRYPTE_VERSION_NUMBER ((ATOMCRYPTE_VERSION_MAJOR * 10000) + \
                                   (ATOMCRYPTE_VERSION_MINOR * 100) + \
                                   ATOMCRYPTE_VERSION_PATCH)

/** Version byte written at the head of every wrapped blob */
#define ATOMCRYPTE_FORMAT_VERSION 0x04

/** Library name */
#define ATOMCRYPTE_LIBRARY_NAME "atomcrypte"

/** Full library description */
#define ATOMCRYPTE_DESCRIPTION "Configurable multi-round substitution-permutation engine (experimental)"

#ifdef NDEBUG
#define ATOMCRYPTE_BUILD_TYPE "Release"
#else
#define ATOMCRYPTE_BUILD_TYPE "Debug"
#endif

#define ATOMCRYPTE_VERSION_AT_LEAST(major, minor, patch) \
    (ATOMCRYPTE_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

#endif /* ATOMCRYPTE_VERSION_H */
