//===-- Type.h - Non-owning LLVM type handle --------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//
//
// A minimal handle over `LLVMTypeRef`, used as the payload of type attributes.
// Types are uniqued per `LLVMContextRef`, so identity is equality.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <llvm-c/Core.h>

#include <llvm/ADT/Hashing.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

namespace quill {

class Type {
public:
  /// Wraps `type`, which must not be null. The handle does not own the type; it is
  /// valid as long as the context that created it.
  explicit Type(LLVMTypeRef type);

  LLVMTypeKind getKind() const { return LLVMGetTypeKind(type); }

  LLVMTypeRef getRaw() const { return type; }

  /// Prints the textual IR form of the type, e.g. `i32` or `{ i8, i32* }`.
  void print(llvm::raw_ostream &os) const;
  std::string str() const;

  bool operator==(const Type &other) const { return type == other.type; }
  bool operator!=(const Type &other) const { return type != other.type; }

private:
  LLVMTypeRef type;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Type &type) {
  type.print(os);
  return os;
}

inline llvm::hash_code hash_value(const Type &type) { return llvm::hash_value(type.getRaw()); }

} // namespace quill
