//===-- Debug.h -------------------------------------------------*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/IR/Attribute.h"
#include "quill/IR/AttributeLoc.h"
#include "quill/IR/AttributeSite.h"

#include <llvm-c/Core.h>

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/raw_ostream.h>

#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace quill {
namespace debug {

namespace {

template <typename T>
concept Iterable = requires(T t) {
  std::begin(t);
  std::end(t);
};

struct Appender {
  llvm::raw_string_ostream stream;
  Appender(std::string &out) : stream(out) {}

  void append(const AttributeVariant &a);
  template <typename T> void append(const std::optional<T> &a);
  template <typename Any> void append(const Any &value);
  template <typename A, typename B> void append(const std::pair<A, B> &a);
  template <Iterable InputIt> void append(const InputIt &collection);
  template <typename InputIt> void appendList(InputIt begin, InputIt end);
  template <typename Any> Appender &operator<<(const Any &v);
};

void Appender::append(const AttributeVariant &a) {
  std::visit([this](const auto &view) { stream << view.getAttribute(); }, a);
}

template <typename T> inline void Appender::append(const std::optional<T> &a) {
  if (a.has_value()) {
    append(a.value());
  } else {
    stream << "NONE";
  }
}

template <typename Any> void Appender::append(const Any &value) { stream << value; }

template <typename A, typename B> void Appender::append(const std::pair<A, B> &a) {
  stream << '(';
  append(a.first);
  stream << ',';
  append(a.second);
  stream << ')';
}

template <Iterable InputIt> inline void Appender::append(const InputIt &collection) {
  appendList(std::begin(collection), std::end(collection));
}

template <typename InputIt> void Appender::appendList(InputIt begin, InputIt end) {
  stream << '[';
  llvm::interleave(begin, end, [this](const auto &n) { append(n); }, [this] { stream << ", "; });
  stream << ']';
}

template <typename Any> Appender &Appender::operator<<(const Any &v) {
  append(v);
  return *this;
}

} // namespace

/// Generate a comma-separated string representation by traversing elements from `begin` to `end`
/// where the element type implements `operator<<`.
template <typename InputIt> inline std::string toStringList(InputIt begin, InputIt end) {
  std::string output;
  Appender(output).appendList(begin, end);
  return output;
}

/// Generate a comma-separated string representation by traversing elements from
/// `collection.begin()` to `collection.end()` where the element type implements `operator<<`.
template <typename InputIt> inline std::string toStringList(const InputIt &collection) {
  return toStringList(collection.begin(), collection.end());
}

template <typename T> inline std::string toStringOne(const T &value) {
  std::string output;
  Appender(output).append(value);
  return output;
}

/// Print a global value as `@name`, or as `@<slot>` when it is unnamed, numbering unnamed
/// globals the way the IR printer does.
void printGlobalName(llvm::raw_ostream &stream, LLVMValueRef global);

/// Print one `<kind>\t<name>` line for every builtin enum attribute kind of the linked LLVM.
void dumpEnumKinds(llvm::raw_ostream &stream);

/// Print every non-empty location of `site` on its own line as `<loc>: <attr> <attr>...`,
/// indented by `indent` spaces.
void dumpAttributes(llvm::raw_ostream &stream, const AttributeSite &site, unsigned indent = 0);

/// Print the attributes of every function in `module`, and of every call or invoke
/// inside function bodies when `includeCallSites` is set.
void dumpModuleAttributes(
    llvm::raw_ostream &stream, LLVMModuleRef module, bool includeCallSites = false
);

} // namespace debug
} // namespace quill
