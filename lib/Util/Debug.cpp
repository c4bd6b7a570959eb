//===-- Debug.cpp - Attribute dump helpers ----------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/Util/Debug.h"

#include <optional>

namespace quill {
namespace debug {

namespace {

llvm::StringRef getValueName(LLVMValueRef value) {
  size_t length = 0;
  const char *name = LLVMGetValueName2(value, &length);
  return llvm::StringRef(name, length);
}

/// Advances `slot` past the unnamed values of one global list, stopping at `global`.
template <typename NextFn>
bool findUnnamedSlot(LLVMValueRef first, NextFn next, LLVMValueRef global, unsigned &slot) {
  for (LLVMValueRef gv = first; gv; gv = next(gv)) {
    if (!getValueName(gv).empty()) {
      continue;
    }
    if (gv == global) {
      return true;
    }
    ++slot;
  }
  return false;
}

std::optional<unsigned> getUnnamedSlot(LLVMValueRef global) {
  LLVMModuleRef module = LLVMGetGlobalParent(global);
  unsigned slot = 0;
  // Same order as the module slot numbering: variables, aliases, ifuncs, functions.
  if (findUnnamedSlot(LLVMGetFirstGlobal(module), LLVMGetNextGlobal, global, slot) ||
      findUnnamedSlot(LLVMGetFirstGlobalAlias(module), LLVMGetNextGlobalAlias, global, slot) ||
      findUnnamedSlot(LLVMGetFirstGlobalIFunc(module), LLVMGetNextGlobalIFunc, global, slot) ||
      findUnnamedSlot(LLVMGetFirstFunction(module), LLVMGetNextFunction, global, slot)) {
    return slot;
  }
  return std::nullopt;
}

bool isCallSite(LLVMValueRef inst) {
  return LLVMIsACallInst(inst) != nullptr || LLVMIsAInvokeInst(inst) != nullptr;
}

void dumpCallSites(llvm::raw_ostream &stream, LLVMValueRef fn) {
  for (LLVMBasicBlockRef bb = LLVMGetFirstBasicBlock(fn); bb; bb = LLVMGetNextBasicBlock(bb)) {
    for (LLVMValueRef inst = LLVMGetFirstInstruction(bb); inst;
         inst = LLVMGetNextInstruction(inst)) {
      if (!isCallSite(inst)) {
        continue;
      }
      stream.indent(2) << "call ";
      LLVMValueRef callee = LLVMGetCalledValue(inst);
      if (LLVMIsAFunction(callee)) {
        printGlobalName(stream, callee);
      } else if (LLVMIsAInlineAsm(callee)) {
        stream << "<inline asm>";
      } else {
        stream << "<indirect>";
      }
      stream << '\n';
      dumpAttributes(stream, AttributeSite::forCallSite(inst), 4);
    }
  }
}

} // namespace

void printGlobalName(llvm::raw_ostream &stream, LLVMValueRef global) {
  stream << '@';
  llvm::StringRef name = getValueName(global);
  if (!name.empty()) {
    stream << name;
  } else if (std::optional<unsigned> slot = getUnnamedSlot(global)) {
    stream << *slot;
  } else {
    stream << "<unnamed>";
  }
}

void dumpEnumKinds(llvm::raw_ostream &stream) {
  // Kind 0 is None and getLastEnumKindId() is one past the last kind.
  for (unsigned kind = 1, end = Attribute::getLastEnumKindId(); kind < end; ++kind) {
    if (std::optional<llvm::StringRef> name = Attribute::lookupEnumKindName(kind)) {
      stream << kind << '\t' << *name << '\n';
    }
  }
}

void dumpAttributes(llvm::raw_ostream &stream, const AttributeSite &site, unsigned indent) {
  for (AttributeLoc loc : site.getLocations()) {
    llvm::SmallVector<Attribute> attrs = site.getAll(loc);
    if (attrs.empty()) {
      continue;
    }
    stream.indent(indent) << loc << ':';
    for (const Attribute &attr : attrs) {
      stream << ' ' << attr;
    }
    stream << '\n';
  }
}

void dumpModuleAttributes(llvm::raw_ostream &stream, LLVMModuleRef module, bool includeCallSites) {
  for (LLVMValueRef fn = LLVMGetFirstFunction(module); fn; fn = LLVMGetNextFunction(fn)) {
    printGlobalName(stream, fn);
    stream << '\n';
    dumpAttributes(stream, AttributeSite::forFunction(fn), 2);
    if (includeCallSites) {
      dumpCallSites(stream, fn);
    }
  }
}

} // namespace debug
} // namespace quill
