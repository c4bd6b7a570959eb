//===-- AttributeTests.cpp - Unit tests for attribute handles ---*- C++ -*-===//
//
// Part of the Quill Project, under the Apache License v2.0.
// See LICENSE.txt for license information.
// Copyright 2025 Veridise Inc.
// SPDX-License-Identifier: Apache-2.0
//
//===----------------------------------------------------------------------===//

#include "quill/IR/Attribute.h"

#include <llvm/IR/Attributes.h>

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "../QuillTestBase.h"

using namespace quill;

class AttributeTests : public QuillTest {};

//===----------------------------------------------------------------------===//
// Kind table
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_getNamedEnumKindId_unknown) {
  ASSERT_EQ(Attribute::getNamedEnumKindId("not-a-real-name"), 0u);
  ASSERT_EQ(Attribute::getNamedEnumKindId(""), 0u);
}

TEST_F(AttributeTests, test_getNamedEnumKindId_builtin) {
  ASSERT_EQ(Attribute::getNamedEnumKindId("align"), unsigned(llvm::Attribute::Alignment));
  ASSERT_EQ(Attribute::getNamedEnumKindId("builtin"), unsigned(llvm::Attribute::Builtin));
  ASSERT_EQ(Attribute::getNamedEnumKindId("nounwind"), unsigned(llvm::Attribute::NoUnwind));
}

TEST_F(AttributeTests, test_getNamedEnumKindId_usesLength) {
  // Only the first five bytes name the attribute.
  llvm::StringRef name("alignxyz", 5);
  ASSERT_EQ(Attribute::getNamedEnumKindId(name), unsigned(llvm::Attribute::Alignment));
}

TEST_F(AttributeTests, test_getLastEnumKindId) {
  unsigned end = Attribute::getLastEnumKindId();
  ASSERT_EQ(end, unsigned(llvm::Attribute::EndAttrKinds));
  ASSERT_GT(end, Attribute::getNamedEnumKindId("align"));
  ASSERT_GT(end, Attribute::getNamedEnumKindId("nounwind"));
  // One past the last kind: the value itself names nothing, its predecessor does.
  ASSERT_EQ(Attribute::lookupEnumKindName(end), std::nullopt);
  std::optional<llvm::StringRef> lastName = Attribute::lookupEnumKindName(end - 1);
  ASSERT_TRUE(lastName.has_value());
  ASSERT_EQ(Attribute::getNamedEnumKindId(*lastName), end - 1);
}

TEST_F(AttributeTests, test_lookupEnumKindName) {
  ASSERT_EQ(Attribute::lookupEnumKindName(Attribute::getNamedEnumKindId("align")), "align");
  ASSERT_EQ(Attribute::lookupEnumKindName(Attribute::getNamedEnumKindId("sret")), "sret");
  ASSERT_EQ(Attribute::lookupEnumKindName(0), std::nullopt);
  ASSERT_EQ(Attribute::lookupEnumKindName(llvm::Attribute::EndAttrKinds), std::nullopt);
}

//===----------------------------------------------------------------------===//
// Enum attributes
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_enum_classification) {
  Attribute attr(createEnum("nounwind"));
  ASSERT_TRUE(attr.isEnum());
  ASSERT_FALSE(attr.isString());
#if QUILL_HAS_TYPE_ATTRIBUTES
  ASSERT_FALSE(attr.isType());
#endif
}

TEST_F(AttributeTests, test_enum_withoutPayload) {
  Attribute attr(createEnum("nounwind"));
  ASSERT_EQ(attr.getEnumKindId(), Attribute::getNamedEnumKindId("nounwind"));
  ASSERT_EQ(attr.getEnumKindName(), "nounwind");
  ASSERT_EQ(attr.getEnumValue(), 0u);
}

TEST_F(AttributeTests, test_enum_withPayload) {
  Attribute align(createEnum("align", 8));
  ASSERT_TRUE(align.isEnum());
  ASSERT_EQ(align.getEnumKindId(), Attribute::getNamedEnumKindId("align"));
  ASSERT_EQ(align.getEnumValue(), 8u);

  Attribute deref(createEnum("dereferenceable", 16));
  ASSERT_TRUE(deref.isEnum());
  ASSERT_EQ(deref.getEnumValue(), 16u);
}

TEST_F(AttributeTests, test_enum_repeatedAccessIsStable) {
  Attribute attr(createEnum("align", 4));
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(attr.isEnum());
    ASSERT_EQ(attr.getEnumKindId(), Attribute::getNamedEnumKindId("align"));
    ASSERT_EQ(attr.getEnumValue(), 4u);
  }
}

//===----------------------------------------------------------------------===//
// String attributes
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_string_classification) {
  Attribute attr(createString("my_key_123", "my_val"));
  ASSERT_TRUE(attr.isString());
  ASSERT_FALSE(attr.isEnum());
#if QUILL_HAS_TYPE_ATTRIBUTES
  ASSERT_FALSE(attr.isType());
#endif
}

TEST_F(AttributeTests, test_string_keyAndValue) {
  Attribute attr(createString("my_key", "my_val"));
  ASSERT_EQ(attr.getStringKind(), "my_key");
  ASSERT_EQ(attr.getStringValue(), "my_val");
  // Repeated reads return the same bytes.
  ASSERT_EQ(attr.getStringKind(), "my_key");
  ASSERT_EQ(attr.getStringValue(), "my_val");
}

TEST_F(AttributeTests, test_string_emptyValue) {
  Attribute attr(createString("flag", ""));
  ASSERT_EQ(attr.getStringKind(), "flag");
  ASSERT_TRUE(attr.getStringValue().empty());
}

TEST_F(AttributeTests, test_string_embeddedNul) {
  std::string key("a\0b", 3);
  std::string value("\0x\0", 3);
  Attribute attr(createString(key, value));
  ASSERT_EQ(attr.getStringKind().size(), 3u);
  ASSERT_EQ(attr.getStringKind().str(), key);
  ASSERT_EQ(attr.getStringValue().size(), 3u);
  ASSERT_EQ(attr.getStringValue().str(), value);
}

//===----------------------------------------------------------------------===//
// Type attributes
//===----------------------------------------------------------------------===//

#if QUILL_HAS_TYPE_ATTRIBUTES
TEST_F(AttributeTests, test_type_classification) {
  Attribute attr(createType("sret", i32()));
  ASSERT_TRUE(attr.isType());
  ASSERT_FALSE(attr.isEnum());
  ASSERT_FALSE(attr.isString());
}

TEST_F(AttributeTests, test_type_kindAndValue) {
  unsigned kindId = Attribute::getNamedEnumKindId("sret");
  Attribute attr(createType("sret", i32()));
  ASSERT_EQ(attr.getEnumKindId(), kindId);
  ASSERT_EQ(attr.getEnumKindName(), "sret");
  ASSERT_EQ(attr.getTypeValue(), Type(i32()));
  ASSERT_NE(attr.getTypeValue(), Type(LLVMInt64TypeInContext(context)));
}

TEST_F(AttributeTests, test_type_getEnumValueFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createType("sret", i32()));
        attr.getEnumValue();
      },
      "getEnumValue\\(\\) requires an enum attribute"
  );
}

TEST_F(AttributeTests, test_type_getTypeValueOnEnumFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createEnum("nounwind"));
        attr.getTypeValue();
      },
      "getTypeValue\\(\\) requires a type attribute"
  );
}
#endif

//===----------------------------------------------------------------------===//
// Contract failures
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_nullAttributeFails) {
  EXPECT_DEATH({ Attribute attr(nullptr); }, "cannot wrap a null attribute");
}

TEST_F(AttributeTests, test_getEnumValueOnStringFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createString("my_key", "my_val"));
        attr.getEnumValue();
      },
      "getEnumValue\\(\\) requires an enum attribute"
  );
}

TEST_F(AttributeTests, test_getEnumKindIdOnStringFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createString("my_key", "my_val"));
        attr.getEnumKindId();
      },
      "getEnumKindId\\(\\) requires an enum or type attribute"
  );
}

TEST_F(AttributeTests, test_getStringKindOnEnumFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createEnum("align", 8));
        attr.getStringKind();
      },
      "getStringKind\\(\\) requires a string attribute"
  );
}

TEST_F(AttributeTests, test_getStringValueOnEnumFails) {
  EXPECT_DEATH(
      {
        Attribute attr(createEnum("align", 8));
        attr.getStringValue();
      },
      "getStringValue\\(\\) requires a string attribute"
  );
}

//===----------------------------------------------------------------------===//
// Identity and printing
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_equalityIsIdentity) {
  Attribute a(createEnum("align", 8));
  Attribute b(createEnum("align", 8));
  Attribute c(createEnum("align", 16));
  // LLVM uniques attributes within a context.
  ASSERT_EQ(a, b);
  ASSERT_NE(a, c);
  ASSERT_EQ(hash_value(a), hash_value(b));
  ASSERT_EQ(a.getRaw(), b.getRaw());
}

TEST_F(AttributeTests, test_print) {
  ASSERT_EQ(Attribute(createEnum("nounwind")).str(), "nounwind");
  ASSERT_EQ(Attribute(createEnum("align", 8)).str(), "align 8");
  ASSERT_EQ(Attribute(createString("my_key", "my_val")).str(), "\"my_key\"=\"my_val\"");
#if QUILL_HAS_TYPE_ATTRIBUTES
  ASSERT_EQ(Attribute(createType("sret", i32())).str(), "sret(i32)");
#endif
}

//===----------------------------------------------------------------------===//
// Shape views
//===----------------------------------------------------------------------===//

TEST_F(AttributeTests, test_classify_enum) {
  AttributeVariant v = Attribute(createEnum("align", 8)).classify();
  ASSERT_TRUE(std::holds_alternative<EnumAttribute>(v));
  const EnumAttribute &view = std::get<EnumAttribute>(v);
  ASSERT_EQ(view.getKindId(), Attribute::getNamedEnumKindId("align"));
  ASSERT_EQ(view.getKindName(), "align");
  ASSERT_EQ(view.getValue(), 8u);
}

TEST_F(AttributeTests, test_classify_string) {
  AttributeVariant v = Attribute(createString("k", "v")).classify();
  ASSERT_TRUE(std::holds_alternative<StringAttribute>(v));
  const StringAttribute &view = std::get<StringAttribute>(v);
  ASSERT_EQ(view.getKey(), "k");
  ASSERT_EQ(view.getValue(), "v");
}

#if QUILL_HAS_TYPE_ATTRIBUTES
TEST_F(AttributeTests, test_classify_type) {
  AttributeVariant v = Attribute(createType("byval", i32())).classify();
  ASSERT_TRUE(std::holds_alternative<TypeAttribute>(v));
  const TypeAttribute &view = std::get<TypeAttribute>(v);
  ASSERT_EQ(view.getKindId(), Attribute::getNamedEnumKindId("byval"));
  ASSERT_EQ(view.getKindName(), "byval");
  ASSERT_EQ(view.getTypeValue(), Type(i32()));
}
#endif

TEST_F(AttributeTests, test_classify_visit) {
  auto describe = [](Attribute attr) {
    return std::visit(
        [](const auto &view) -> std::string {
          using ViewT = std::decay_t<decltype(view)>;
          if constexpr (std::is_same_v<ViewT, EnumAttribute>) {
            return "enum";
          } else if constexpr (std::is_same_v<ViewT, StringAttribute>) {
            return "string";
          } else {
            return "type";
          }
        },
        attr.classify()
    );
  };
  ASSERT_EQ(describe(Attribute(createEnum("cold"))), "enum");
  ASSERT_EQ(describe(Attribute(createString("k", "v"))), "string");
#if QUILL_HAS_TYPE_ATTRIBUTES
  ASSERT_EQ(describe(Attribute(createType("sret", i32()))), "type");
#endif
}

TEST_F(AttributeTests, test_dynCast) {
  Attribute align(createEnum("align", 8));
  std::optional<EnumAttribute> asEnum = align.dynCast<EnumAttribute>();
  ASSERT_TRUE(asEnum.has_value());
  ASSERT_EQ(asEnum->getValue(), 8u);
  ASSERT_EQ(asEnum->getAttribute(), align);
  ASSERT_FALSE(align.dynCast<StringAttribute>().has_value());

  Attribute str(createString("k", "v"));
  ASSERT_FALSE(str.dynCast<EnumAttribute>().has_value());
  ASSERT_EQ(str.dynCast<StringAttribute>()->getValue(), "v");
}

TEST_F(AttributeTests, test_viewOfWrongShapeFails) {
  EXPECT_DEATH(
      { EnumAttribute view(Attribute(createString("k", "v"))); },
      "EnumAttribute requires an enum attribute"
  );
}
