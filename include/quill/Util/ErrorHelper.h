//===-- ErrorHelper.h -------------------------------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#pragma once

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Compiler.h>
#include <llvm/Support/ErrorHandling.h>

namespace quill {

/// Halts with `errMsg` unless `condition` holds. Used for contract checks that must
/// stay active in release builds, where an `assert` would compile away.
inline void ensure(bool condition, const llvm::Twine &errMsg) {
  if (LLVM_UNLIKELY(!condition)) {
    llvm::report_fatal_error(errMsg);
  }
}

} // namespace quill
