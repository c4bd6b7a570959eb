//===-- AttributeLoc.cpp - Attribute attachment locations -------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/IR/AttributeLoc.h"
#include "quill/Util/ErrorHelper.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/ErrorHandling.h>

namespace quill {

namespace {

constexpr LLVMAttributeIndex ReturnIndex = LLVMAttributeReturnIndex;
// LLVM-C declares the function index as the enumerator -1.
constexpr LLVMAttributeIndex FunctionIndex =
    static_cast<LLVMAttributeIndex>(LLVMAttributeFunctionIndex);

static_assert(ReturnIndex == 0U);
static_assert(FunctionIndex == std::numeric_limits<LLVMAttributeIndex>::max());

} // namespace

AttributeLoc AttributeLoc::fromIndex(LLVMAttributeIndex index) {
  if (index == ReturnIndex) {
    return getReturn();
  }
  if (index == FunctionIndex) {
    return getFunction();
  }
  return getParam(index - 1);
}

unsigned AttributeLoc::getParamIndex() const {
  ensure(isParam(), "getParamIndex() requires a parameter location");
  return paramIndex;
}

LLVMAttributeIndex AttributeLoc::getIndex() const {
  switch (kind) {
  case Kind::Return:
    return ReturnIndex;
  case Kind::Param:
    ensure(
        paramIndex <= MaxParamIndex,
        "parameter index " + llvm::Twine(paramIndex) + " must be <= " + llvm::Twine(MaxParamIndex)
    );
    return paramIndex + 1;
  case Kind::Function:
    return FunctionIndex;
  }
  llvm_unreachable("unhandled AttributeLoc kind");
}

void AttributeLoc::print(llvm::raw_ostream &os) const {
  switch (kind) {
  case Kind::Return:
    os << "return";
    return;
  case Kind::Param:
    os << "param(" << paramIndex << ')';
    return;
  case Kind::Function:
    os << "function";
    return;
  }
  llvm_unreachable("unhandled AttributeLoc kind");
}

} // namespace quill
