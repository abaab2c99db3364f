/**
 * Copyright (C) 2022 Whisperity
 *
 * SPDX-License-Identifier: GPL-3.0
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/* This file contains the CMake-level configuration variables that are exposed
 * to the compilers executed.
 */
#ifndef PROCEXIT_CONFIG_H
#define PROCEXIT_CONFIG_H

/* If true, the built library will contain some additional log outputs that
 * are needed for verbose debugging of exit code classification.
 *
 * Turn off to cut down further on the binary size for production.
 */
#cmakedefine01 PROCEXIT_NON_ESSENTIAL_LOGS

/* If set, the library is built for a Unix platform, and the platform-specific
 * process status decoding is available.
 */
#cmakedefine PROCEXIT_PLATFORM_UNIX

#endif /* PROCEXIT_CONFIG_H */
