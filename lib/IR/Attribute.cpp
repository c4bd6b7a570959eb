//===-- Attribute.cpp - Safe LLVM attribute handles -------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/IR/Attribute.h"
#include "quill/Util/ErrorHelper.h"

#include <llvm/ADT/Twine.h>
#include <llvm/IR/Attributes.h>

namespace quill {

static_assert(
    QUILL_LLVM_VERSION_MAJOR >= QUILL_MIN_LLVM_VERSION_MAJOR &&
        QUILL_LLVM_VERSION_MAJOR <= QUILL_MAX_LLVM_VERSION_MAJOR,
    "classify() does not cover every attribute shape of this LLVM release"
);

namespace {

bool hasEnumKind(const Attribute &attr) {
#if QUILL_HAS_TYPE_ATTRIBUTES
  return attr.isEnum() || attr.isType();
#else
  return attr.isEnum();
#endif
}

} // namespace

//===----------------------------------------------------------------------===//
// Attribute
//===----------------------------------------------------------------------===//

Attribute::Attribute(LLVMAttributeRef attribute) : attribute(attribute) {
  ensure(attribute != nullptr, "cannot wrap a null attribute");
}

bool Attribute::isEnum() const { return LLVMIsEnumAttribute(attribute); }

bool Attribute::isString() const { return LLVMIsStringAttribute(attribute); }

#if QUILL_HAS_TYPE_ATTRIBUTES
bool Attribute::isType() const { return LLVMIsTypeAttribute(attribute); }
#endif

unsigned Attribute::getNamedEnumKindId(llvm::StringRef name) {
  return LLVMGetEnumAttributeKindForName(name.data(), name.size());
}

unsigned Attribute::getLastEnumKindId() { return LLVMGetLastEnumAttributeKind(); }

std::optional<llvm::StringRef> Attribute::lookupEnumKindName(unsigned kindId) {
  if (kindId == static_cast<unsigned>(llvm::Attribute::None) ||
      kindId >= static_cast<unsigned>(llvm::Attribute::EndAttrKinds)) {
    return std::nullopt;
  }
  return llvm::Attribute::getNameFromAttrKind(static_cast<llvm::Attribute::AttrKind>(kindId));
}

unsigned Attribute::getEnumKindId() const {
  ensure(hasEnumKind(*this), "getEnumKindId() requires an enum or type attribute");
  return LLVMGetEnumAttributeKind(attribute);
}

llvm::StringRef Attribute::getEnumKindName() const {
  ensure(hasEnumKind(*this), "getEnumKindName() requires an enum or type attribute");
  return llvm::Attribute::getNameFromAttrKind(llvm::unwrap(attribute).getKindAsEnum());
}

uint64_t Attribute::getEnumValue() const {
  ensure(isEnum(), "getEnumValue() requires an enum attribute");
  return LLVMGetEnumAttributeValue(attribute);
}

llvm::StringRef Attribute::getStringKind() const {
  ensure(isString(), "getStringKind() requires a string attribute");
  unsigned length = 0;
  const char *key = LLVMGetStringAttributeKind(attribute, &length);
  return llvm::StringRef(key, length);
}

llvm::StringRef Attribute::getStringValue() const {
  ensure(isString(), "getStringValue() requires a string attribute");
  unsigned length = 0;
  const char *value = LLVMGetStringAttributeValue(attribute, &length);
  return llvm::StringRef(value, length);
}

#if QUILL_HAS_TYPE_ATTRIBUTES
Type Attribute::getTypeValue() const {
  ensure(isType(), "getTypeValue() requires a type attribute");
  return Type(LLVMGetTypeAttributeValue(attribute));
}
#endif

AttributeVariant Attribute::classify() const {
  if (isString()) {
    return StringAttribute(*this);
  }
#if QUILL_HAS_TYPE_ATTRIBUTES
  if (isType()) {
    return TypeAttribute(*this);
  }
#endif
  if (!isEnum()) {
    llvm::report_fatal_error("unsupported attribute shape: " + llvm::Twine(str()));
  }
  return EnumAttribute(*this);
}

void Attribute::print(llvm::raw_ostream &os) const {
  os << llvm::unwrap(attribute).getAsString();
}

std::string Attribute::str() const { return llvm::unwrap(attribute).getAsString(); }

//===----------------------------------------------------------------------===//
// Shape views
//===----------------------------------------------------------------------===//

EnumAttribute::EnumAttribute(Attribute attr) : attr(attr) {
  ensure(classof(attr), "EnumAttribute requires an enum attribute");
}

StringAttribute::StringAttribute(Attribute attr) : attr(attr) {
  ensure(classof(attr), "StringAttribute requires a string attribute");
}

llvm::StringRef StringAttribute::getKey() const {
  unsigned length = 0;
  const char *key = LLVMGetStringAttributeKind(attr.getRaw(), &length);
  return llvm::StringRef(key, length);
}

llvm::StringRef StringAttribute::getValue() const {
  unsigned length = 0;
  const char *value = LLVMGetStringAttributeValue(attr.getRaw(), &length);
  return llvm::StringRef(value, length);
}

#if QUILL_HAS_TYPE_ATTRIBUTES
TypeAttribute::TypeAttribute(Attribute attr) : attr(attr) {
  ensure(classof(attr), "TypeAttribute requires a type attribute");
}
#endif

} // namespace quill
