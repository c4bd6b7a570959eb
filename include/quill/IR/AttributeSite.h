//===-- AttributeSite.h - Attribute attachment points -----------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//
//
// This header declares `quill::AttributeSite`, which reads and edits the attributes
// of a function or a call site through the LLVM-C attribute API, addressed by
// `quill::AttributeLoc`.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/IR/Attribute.h"
#include "quill/IR/AttributeLoc.h"

#include <llvm-c/Core.h>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>

namespace quill {

/// A function or call site that attributes can be attached to. Does not own the
/// underlying value.
class AttributeSite {
public:
  enum class Kind : uint8_t { Function, CallSite };

  /// Wraps a function value. Halts if `fn` is null or not a function.
  static AttributeSite forFunction(LLVMValueRef fn);

  /// Wraps a `call` or `invoke` instruction. Halts if `call` is null or neither.
  static AttributeSite forCallSite(LLVMValueRef call);

  Kind getKind() const { return kind; }
  LLVMValueRef getRaw() const { return value; }

  /// Number of formal parameters of a function, or of argument operands of a call.
  unsigned getNumParams() const;

  /// Every location of this site: the function, the return value, then each
  /// parameter in order.
  llvm::SmallVector<AttributeLoc> getLocations() const;

  void add(AttributeLoc loc, Attribute attr);

  unsigned count(AttributeLoc loc) const;

  llvm::SmallVector<Attribute> getAll(AttributeLoc loc) const;

  /// Returns the enum or type attribute with `kindId` at `loc`, if any.
  std::optional<Attribute> getEnum(AttributeLoc loc, unsigned kindId) const;

  /// Returns the string attribute with `key` at `loc`, if any.
  std::optional<Attribute> getString(AttributeLoc loc, llvm::StringRef key) const;

  void removeEnum(AttributeLoc loc, unsigned kindId);
  void removeString(AttributeLoc loc, llvm::StringRef key);

  /// Prints `@name` for a function and `call site in @name` for a call site, where
  /// `name` is the enclosing function.
  void print(llvm::raw_ostream &os) const;

private:
  AttributeSite(Kind kind, LLVMValueRef value) : kind(kind), value(value) {}

  /// Encodes `loc`, halting if it names a parameter this site does not have.
  LLVMAttributeIndex getCheckedIndex(AttributeLoc loc) const;

  Kind kind;
  LLVMValueRef value;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const AttributeSite &site) {
  site.print(os);
  return os;
}

} // namespace quill
