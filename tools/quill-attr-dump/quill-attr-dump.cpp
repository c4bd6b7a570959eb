//===-- quill-attr-dump.cpp - Quill attribute dump tool ---------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//
///
/// \file
/// This file implements a tool that prints the attributes attached to every
/// function (and optionally every call site) of an LLVM IR or bitcode file.
///
//===----------------------------------------------------------------------===//

#include "quill/Config/Config.h"
#include "quill/Util/Debug.h"

#include <llvm-c/Core.h>
#include <llvm-c/IRReader.h>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdlib>
#include <string>

#include "tools/config.h"

namespace cl = llvm::cl;

static cl::OptionCategory DumpCategory("quill-attr-dump options");

static cl::opt<std::string> InputFilename(
    cl::Positional, cl::desc("<input .ll or .bc file>"), cl::init("-"),
    cl::value_desc("filename"), cl::cat(DumpCategory)
);

static cl::opt<bool> IncludeCallSites(
    "call-sites", cl::desc("Also print the attributes of each call and invoke"),
    cl::cat(DumpCategory)
);

static cl::opt<bool> ListKinds(
    "list-kinds", cl::desc("Print every builtin attribute kind id with its name and exit"),
    cl::cat(DumpCategory)
);

static LLVMMemoryBufferRef readInput(llvm::StringRef filename) {
  LLVMMemoryBufferRef buffer = nullptr;
  char *message = nullptr;
  LLVMBool failed = filename == "-"
                        ? LLVMCreateMemoryBufferWithSTDIN(&buffer, &message)
                        : LLVMCreateMemoryBufferWithContentsOfFile(
                              std::string(filename).c_str(), &buffer, &message
                          );
  if (failed) {
    llvm::WithColor::error() << "could not open '" << filename << "': " << message << '\n';
    LLVMDisposeMessage(message);
    return nullptr;
  }
  return buffer;
}

int main(int argc, char **argv) {
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);
  llvm::setBugReportMsg("PLEASE submit a bug report to " BUG_REPORT_URL
                        " and include the crash backtrace and the input file.\n");
  llvm::cl::AddExtraVersionPrinter([](llvm::raw_ostream &os) {
    os << "\nQuill (" QUILL_URL "):\n  Quill version " QUILL_VERSION_STRING "\n";
  });

  cl::HideUnrelatedOptions(DumpCategory);
  cl::ParseCommandLineOptions(argc, argv, "Quill attribute dump\n");

  if (ListKinds) {
    quill::debug::dumpEnumKinds(llvm::outs());
    return EXIT_SUCCESS;
  }

  LLVMMemoryBufferRef buffer = readInput(InputFilename);
  if (!buffer) {
    return EXIT_FAILURE;
  }

  LLVMContextRef ctx = LLVMContextCreate();
  LLVMModuleRef module = nullptr;
  char *message = nullptr;
  // Takes ownership of `buffer`, whether or not parsing succeeds.
  if (LLVMParseIRInContext(ctx, buffer, &module, &message)) {
    llvm::WithColor::error() << InputFilename << ": " << message << '\n';
    LLVMDisposeMessage(message);
    LLVMContextDispose(ctx);
    return EXIT_FAILURE;
  }

  quill::debug::dumpModuleAttributes(llvm::outs(), module, IncludeCallSites);

  LLVMDisposeModule(module);
  LLVMContextDispose(ctx);
  return EXIT_SUCCESS;
}
