/* SPDX-License-Identifier: LGPL-3.0-only */

/* Configuration of the library, rendered by CMake at configure time. */
#ifndef PTYSPAWN_CONFIG_H
#define PTYSPAWN_CONFIG_H

/* If true, the verbose tracing of the lifecycle of handles, terminal pairs and
 * child processes is built into the library.
 */
#cmakedefine01 PTYSPAWN_NON_ESSENTIAL_LOGS

/* The name of the platform the library was configured for. */
#define PTYSPAWN_PLATFORM "${PTYSPAWN_PLATFORM}"

/* Numeric identifiers of the platforms, so that
 *     #if PTYSPAWN_PLATFORM_ID == PTYSPAWN_PLATFORM_ID_Win32
 * is possible where a plain #ifdef does not suffice.
 */
/* NOLINTBEGIN(modernize-macro-to-enum) */
#define PTYSPAWN_PLATFORM_ID_Unsupported 0
#define PTYSPAWN_PLATFORM_ID_Unix 1
#define PTYSPAWN_PLATFORM_ID_Win32 2
/* NOLINTEND(modernize-macro-to-enum) */

/* clang-format off */
#define PTYSPAWN_PLATFORM_ID PTYSPAWN_PLATFORM_ID_${PTYSPAWN_PLATFORM}
/* clang-format on */

/* Set if the terminal pairs are kernel devices, allocated by openpty(). */
#cmakedefine PTYSPAWN_PLATFORM_UNIX

/* Set if the terminal pairs are pseudo console sessions joined to pipes. */
#cmakedefine PTYSPAWN_PLATFORM_WIN32

#endif /* PTYSPAWN_CONFIG_H */
