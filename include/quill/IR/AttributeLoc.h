//===-- AttributeLoc.h - Attribute attachment locations ---------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#pragma once

#include <llvm-c/Core.h>

#include <llvm/ADT/Hashing.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <limits>

namespace quill {

/// Determines where on a function (or call site) an attribute is attached.
class AttributeLoc {
public:
  enum class Kind : uint8_t {
    /// The return value.
    Return,
    /// One of the parameters, 0-indexed.
    Param,
    /// The function itself.
    Function,
  };

  /// Largest parameter index that can be encoded. `getParam(i).getIndex()` is `i + 1`,
  /// which must stay below the function sentinel `LLVMAttributeFunctionIndex`.
  static constexpr unsigned MaxParamIndex = std::numeric_limits<unsigned>::max() - 2;

  static AttributeLoc getReturn() { return AttributeLoc(Kind::Return, 0); }
  static AttributeLoc getParam(unsigned index) { return AttributeLoc(Kind::Param, index); }
  static AttributeLoc getFunction() { return AttributeLoc(Kind::Function, 0); }

  /// Decodes a flat LLVM-C attribute index.
  static AttributeLoc fromIndex(LLVMAttributeIndex index);

  Kind getKind() const { return kind; }
  bool isReturn() const { return kind == Kind::Return; }
  bool isParam() const { return kind == Kind::Param; }
  bool isFunction() const { return kind == Kind::Function; }

  unsigned getParamIndex() const;

  /// Encodes this location as the flat index used by the LLVM-C attribute API:
  /// the return value is 0, parameter `i` is `i + 1`, and the function is
  /// `LLVMAttributeFunctionIndex`. Halts if the parameter index exceeds
  /// `MaxParamIndex`.
  LLVMAttributeIndex getIndex() const;

  void print(llvm::raw_ostream &os) const;

  bool operator==(const AttributeLoc &other) const {
    return kind == other.kind && paramIndex == other.paramIndex;
  }
  bool operator!=(const AttributeLoc &other) const { return !(*this == other); }

private:
  AttributeLoc(Kind kind, unsigned paramIndex) : kind(kind), paramIndex(paramIndex) {}

  Kind kind;
  unsigned paramIndex;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const AttributeLoc &loc) {
  loc.print(os);
  return os;
}

inline llvm::hash_code hash_value(const AttributeLoc &loc) {
  return llvm::hash_combine(loc.getKind(), loc.isParam() ? loc.getParamIndex() : 0);
}

} // namespace quill
