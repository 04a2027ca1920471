/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

// Macros used for defining symbol visibility, only GLIBC is supported
#if (defined(__GNUC__) && !defined(__MINGW32__) && !defined(__MINGW64__))
#define KERNJIT_EXPORT __attribute__((visibility("default")))
#define KERNJIT_HIDDEN __attribute__((visibility("hidden")))
#else
#define KERNJIT_EXPORT
#define KERNJIT_HIDDEN
#endif
