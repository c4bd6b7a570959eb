//===-- Type.cpp - Non-owning LLVM type handle ------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/IR/Type.h"
#include "quill/Util/ErrorHelper.h"

namespace quill {

Type::Type(LLVMTypeRef type) : type(type) { ensure(type != nullptr, "cannot wrap a null type"); }

void Type::print(llvm::raw_ostream &os) const {
  char *msg = LLVMPrintTypeToString(type);
  os << msg;
  LLVMDisposeMessage(msg);
}

std::string Type::str() const {
  std::string out;
  llvm::raw_string_ostream os(out);
  print(os);
  return os.str();
}

} // namespace quill
