//===-- AttributeSite.cpp - Attribute attachment points ---------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/IR/AttributeSite.h"
#include "quill/Util/Debug.h"
#include "quill/Util/ErrorHelper.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>

#include <limits>

#define DEBUG_TYPE "quill-attribute-site"

namespace quill {

namespace {

unsigned getKeyLength(llvm::StringRef key) {
  ensure(key.size() <= std::numeric_limits<unsigned>::max(), "string attribute key is too long");
  return static_cast<unsigned>(key.size());
}

} // namespace

AttributeSite AttributeSite::forFunction(LLVMValueRef fn) {
  ensure(fn != nullptr, "cannot wrap a null function");
  ensure(LLVMIsAFunction(fn) != nullptr, "value is not a function");
  return AttributeSite(Kind::Function, fn);
}

AttributeSite AttributeSite::forCallSite(LLVMValueRef call) {
  ensure(call != nullptr, "cannot wrap a null call site");
  ensure(
      LLVMIsACallInst(call) != nullptr || LLVMIsAInvokeInst(call) != nullptr,
      "value is not a call or invoke instruction"
  );
  return AttributeSite(Kind::CallSite, call);
}

unsigned AttributeSite::getNumParams() const {
  if (kind == Kind::Function) {
    return LLVMCountParams(value);
  }
  return LLVMGetNumArgOperands(value);
}

llvm::SmallVector<AttributeLoc> AttributeSite::getLocations() const {
  llvm::SmallVector<AttributeLoc> locs = {AttributeLoc::getFunction(), AttributeLoc::getReturn()};
  for (unsigned i = 0, e = getNumParams(); i < e; ++i) {
    locs.push_back(AttributeLoc::getParam(i));
  }
  return locs;
}

LLVMAttributeIndex AttributeSite::getCheckedIndex(AttributeLoc loc) const {
  if (loc.isParam()) {
    unsigned numParams = getNumParams();
    ensure(
        loc.getParamIndex() < numParams, "parameter index " + llvm::Twine(loc.getParamIndex()) +
                                             " is out of range for a site with " +
                                             llvm::Twine(numParams) + " parameters"
    );
  }
  return loc.getIndex();
}

void AttributeSite::add(AttributeLoc loc, Attribute attr) {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  LLVM_DEBUG(llvm::dbgs() << "Adding " << attr << " to " << loc << " of " << *this << '\n');
  if (kind == Kind::Function) {
    LLVMAddAttributeAtIndex(value, idx, attr.getRaw());
  } else {
    LLVMAddCallSiteAttribute(value, idx, attr.getRaw());
  }
}

unsigned AttributeSite::count(AttributeLoc loc) const {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  if (kind == Kind::Function) {
    return LLVMGetAttributeCountAtIndex(value, idx);
  }
  return LLVMGetCallSiteAttributeCount(value, idx);
}

llvm::SmallVector<Attribute> AttributeSite::getAll(AttributeLoc loc) const {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  llvm::SmallVector<LLVMAttributeRef> raw(count(loc), nullptr);
  if (raw.empty()) {
    return {};
  }
  if (kind == Kind::Function) {
    LLVMGetAttributesAtIndex(value, idx, raw.data());
  } else {
    LLVMGetCallSiteAttributes(value, idx, raw.data());
  }

  llvm::SmallVector<Attribute> attrs;
  attrs.reserve(raw.size());
  for (LLVMAttributeRef ref : raw) {
    attrs.push_back(Attribute(ref));
  }
  return attrs;
}

std::optional<Attribute> AttributeSite::getEnum(AttributeLoc loc, unsigned kindId) const {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  LLVMAttributeRef ref = kind == Kind::Function ? LLVMGetEnumAttributeAtIndex(value, idx, kindId)
                                                : LLVMGetCallSiteEnumAttribute(value, idx, kindId);
  if (!ref) {
    return std::nullopt;
  }
  return Attribute(ref);
}

std::optional<Attribute> AttributeSite::getString(AttributeLoc loc, llvm::StringRef key) const {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  unsigned keyLen = getKeyLength(key);
  LLVMAttributeRef ref = kind == Kind::Function
                             ? LLVMGetStringAttributeAtIndex(value, idx, key.data(), keyLen)
                             : LLVMGetCallSiteStringAttribute(value, idx, key.data(), keyLen);
  if (!ref) {
    return std::nullopt;
  }
  return Attribute(ref);
}

void AttributeSite::removeEnum(AttributeLoc loc, unsigned kindId) {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  LLVM_DEBUG(
      llvm::dbgs() << "Removing enum kind " << kindId << " from " << loc << " of " << *this << '\n'
  );
  if (kind == Kind::Function) {
    LLVMRemoveEnumAttributeAtIndex(value, idx, kindId);
  } else {
    LLVMRemoveCallSiteEnumAttribute(value, idx, kindId);
  }
}

void AttributeSite::removeString(AttributeLoc loc, llvm::StringRef key) {
  LLVMAttributeIndex idx = getCheckedIndex(loc);
  unsigned keyLen = getKeyLength(key);
  LLVM_DEBUG(
      llvm::dbgs() << "Removing string key \"" << key << "\" from " << loc << " of " << *this
                   << '\n'
  );
  if (kind == Kind::Function) {
    LLVMRemoveStringAttributeAtIndex(value, idx, key.data(), keyLen);
  } else {
    LLVMRemoveCallSiteStringAttribute(value, idx, key.data(), keyLen);
  }
}

void AttributeSite::print(llvm::raw_ostream &os) const {
  if (kind == Kind::Function) {
    debug::printGlobalName(os, value);
    return;
  }
  LLVMBasicBlockRef block = LLVMGetInstructionParent(value);
  if (!block) {
    os << "detached call site";
    return;
  }
  os << "call site in ";
  debug::printGlobalName(os, LLVMGetBasicBlockParent(block));
}

} // namespace quill
