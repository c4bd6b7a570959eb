//===-- QuillTestBase.h -----------------------------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/IR/Attribute.h"

#include <llvm-c/Core.h>
#include <llvm-c/IRReader.h>

#include <llvm/ADT/StringRef.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

class QuillTest : public ::testing::Test {
protected:
  LLVMContextRef context;
  LLVMModuleRef module;

  QuillTest()
      : context(LLVMContextCreate()), module(LLVMModuleCreateWithNameInContext("test", context)) {}

  ~QuillTest() override {
    LLVMDisposeModule(module);
    LLVMContextDispose(context);
  }

  /// Replaces the fixture module with the module parsed from textual IR.
  void parseModule(llvm::StringRef ir) {
    LLVMMemoryBufferRef buffer =
        LLVMCreateMemoryBufferWithMemoryRangeCopy(ir.data(), ir.size(), "test.ll");
    LLVMModuleRef parsed = nullptr;
    char *message = nullptr;
    if (LLVMParseIRInContext(context, buffer, &parsed, &message)) {
      std::string error(message);
      LLVMDisposeMessage(message);
      FAIL() << "invalid test IR: " << error;
    }
    LLVMDisposeModule(module);
    module = parsed;
  }

  LLVMTypeRef i32() { return LLVMInt32TypeInContext(context); }

  LLVMTypeRef i32Ptr() { return LLVMPointerType(i32(), 0); }

  LLVMAttributeRef createEnum(llvm::StringRef name, uint64_t value = 0) {
    return LLVMCreateEnumAttribute(context, quill::Attribute::getNamedEnumKindId(name), value);
  }

  LLVMAttributeRef createString(llvm::StringRef key, llvm::StringRef value) {
    return LLVMCreateStringAttribute(
        context, key.data(), static_cast<unsigned>(key.size()), value.data(),
        static_cast<unsigned>(value.size())
    );
  }

#if QUILL_HAS_TYPE_ATTRIBUTES
  LLVMAttributeRef createType(llvm::StringRef name, LLVMTypeRef type) {
    return LLVMCreateTypeAttribute(context, quill::Attribute::getNamedEnumKindId(name), type);
  }
#endif

  /// Declares `i32 @name(i32*, i32*)`.
  LLVMValueRef createCallee(const char *name = "callee") {
    LLVMTypeRef params[] = {i32Ptr(), i32Ptr()};
    return LLVMAddFunction(module, name, LLVMFunctionType(i32(), params, 2, false));
  }

  /// Defines `i32 @caller(i32* %p)` whose body calls `callee(%p, %p)`, and returns the call.
  LLVMValueRef createCallTo(LLVMValueRef callee, const char *name = "caller") {
    LLVMTypeRef params[] = {i32Ptr()};
    LLVMValueRef caller =
        LLVMAddFunction(module, name, LLVMFunctionType(i32(), params, 1, false));
    LLVMBuilderRef builder = LLVMCreateBuilderInContext(context);
    LLVMPositionBuilderAtEnd(builder, LLVMAppendBasicBlockInContext(context, caller, "entry"));
    LLVMValueRef p = LLVMGetParam(caller, 0);
    LLVMValueRef args[] = {p, p};
    LLVMValueRef call =
        LLVMBuildCall2(builder, LLVMGlobalGetValueType(callee), callee, args, 2, "result");
    LLVMBuildRet(builder, call);
    LLVMDisposeBuilder(builder);
    return call;
  }
};
