//===-- config.h - Quill tool configurations --------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#pragma once

#include <llvm/Support/PrettyStackTrace.h>

#define BUG_REPORT_URL "https://github.com/Veridise/quill/issues"
