//===-- Attribute.h - Safe LLVM attribute handles ---------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//
//
// This header declares `quill::Attribute`, a non-owning handle over an LLVM-C
// `LLVMAttributeRef`, and the per-shape views returned by `Attribute::classify()`.
//
// An LLVM attribute has one of three shapes:
//   - enum:   a builtin kind id plus an integer payload (`align 8`, `nounwind`)
//   - string: an arbitrary key/value pair (`"frame-pointer"="all"`)
//   - type:   a builtin kind id plus a type payload (`sret(i32)`), LLVM 12+
//
// The shape-specific accessors on `Attribute` check the shape and halt the process
// on a mismatch. Code that does not want to check shapes by hand should use
// `classify()` and `std::visit` the resulting variant instead.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/Config/Config.h"
#include "quill/IR/Type.h"

#include <llvm-c/Core.h>

#include <llvm/ADT/Hashing.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace quill {

class EnumAttribute;
class StringAttribute;
#if QUILL_HAS_TYPE_ATTRIBUTES
class TypeAttribute;
#endif

#if QUILL_HAS_TYPE_ATTRIBUTES
using AttributeVariant = std::variant<EnumAttribute, StringAttribute, TypeAttribute>;
#else
using AttributeVariant = std::variant<EnumAttribute, StringAttribute>;
#endif

/// Functions, function parameters, and return values can carry `Attribute`s that
/// tell optimizations and code generation how to treat them.
///
/// The handle does not own the underlying attribute. It stays valid for as long as
/// the `LLVMContextRef` that created the attribute is alive, and so do the
/// `StringRef`s returned by `getStringKind()` and `getStringValue()`.
class Attribute {
public:
  /// Wraps `attribute`, which must not be null.
  explicit Attribute(LLVMAttributeRef attribute);

  /// Returns true if this is an enum attribute, with or without an integer payload.
  bool isEnum() const;

  /// Returns true if this is a string (key/value) attribute.
  bool isString() const;

#if QUILL_HAS_TYPE_ATTRIBUTES
  /// Returns true if this is a type attribute.
  bool isType() const;
#endif

  /// Returns the kind id of the builtin attribute called `name`, or 0 if no builtin
  /// attribute has that name.
  static unsigned getNamedEnumKindId(llvm::StringRef name);

  /// Returns one past the highest builtin kind id known to the linked LLVM. The
  /// returned value is not itself a kind.
  static unsigned getLastEnumKindId();

  /// Returns the name of the builtin attribute with `kindId`, or `std::nullopt` if
  /// `kindId` is not in the builtin table. The inverse of `getNamedEnumKindId()`.
  static std::optional<llvm::StringRef> lookupEnumKindName(unsigned kindId);

  /// Returns the kind id of an enum or type attribute.
  unsigned getEnumKindId() const;

  /// Returns the builtin name of an enum or type attribute, e.g. "align".
  llvm::StringRef getEnumKindName() const;

  /// Returns the integer payload of an enum attribute. Enum attributes without a
  /// payload (e.g. `nounwind`) report 0.
  uint64_t getEnumValue() const;

  /// Returns the key of a string attribute. The bytes are returned as stored by
  /// LLVM: they are not checked for UTF-8 and may contain NUL characters.
  llvm::StringRef getStringKind() const;

  /// Returns the value of a string attribute, with the same caveats as
  /// `getStringKind()`.
  llvm::StringRef getStringValue() const;

#if QUILL_HAS_TYPE_ATTRIBUTES
  /// Returns the type payload of a type attribute.
  Type getTypeValue() const;
#endif

  /// Determines the shape of this attribute once and returns the matching view. Halts
  /// on an attribute that has none of the shapes, which the supported LLVM releases
  /// never produce.
  AttributeVariant classify() const;

  /// Returns this attribute as `ViewT` if it has that shape.
  template <typename ViewT> std::optional<ViewT> dynCast() const;

  LLVMAttributeRef getRaw() const { return attribute; }

  /// Prints the attribute the way it appears in textual IR.
  void print(llvm::raw_ostream &os) const;
  std::string str() const;

  bool operator==(const Attribute &other) const { return attribute == other.attribute; }
  bool operator!=(const Attribute &other) const { return attribute != other.attribute; }

private:
  LLVMAttributeRef attribute;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Attribute &attr) {
  attr.print(os);
  return os;
}

inline llvm::hash_code hash_value(const Attribute &attr) {
  return llvm::hash_value(attr.getRaw());
}

//===----------------------------------------------------------------------===//
// Shape views
//===----------------------------------------------------------------------===//

/// An attribute known to be an enum attribute.
class EnumAttribute {
public:
  explicit EnumAttribute(Attribute attr);

  static bool classof(Attribute attr) { return attr.isEnum(); }

  unsigned getKindId() const { return LLVMGetEnumAttributeKind(attr.getRaw()); }
  llvm::StringRef getKindName() const { return attr.getEnumKindName(); }
  uint64_t getValue() const { return LLVMGetEnumAttributeValue(attr.getRaw()); }

  Attribute getAttribute() const { return attr; }

  bool operator==(const EnumAttribute &other) const { return attr == other.attr; }

private:
  Attribute attr;
};

/// An attribute known to be a string attribute.
class StringAttribute {
public:
  explicit StringAttribute(Attribute attr);

  static bool classof(Attribute attr) { return attr.isString(); }

  llvm::StringRef getKey() const;
  llvm::StringRef getValue() const;

  Attribute getAttribute() const { return attr; }

  bool operator==(const StringAttribute &other) const { return attr == other.attr; }

private:
  Attribute attr;
};

#if QUILL_HAS_TYPE_ATTRIBUTES
/// An attribute known to be a type attribute.
class TypeAttribute {
public:
  explicit TypeAttribute(Attribute attr);

  static bool classof(Attribute attr) { return attr.isType(); }

  unsigned getKindId() const { return LLVMGetEnumAttributeKind(attr.getRaw()); }
  llvm::StringRef getKindName() const { return attr.getEnumKindName(); }
  Type getTypeValue() const { return Type(LLVMGetTypeAttributeValue(attr.getRaw())); }

  Attribute getAttribute() const { return attr; }

  bool operator==(const TypeAttribute &other) const { return attr == other.attr; }

private:
  Attribute attr;
};
#endif

template <typename ViewT> std::optional<ViewT> Attribute::dynCast() const {
  if (!ViewT::classof(*this)) {
    return std::nullopt;
  }
  return ViewT(*this);
}

} // namespace quill
