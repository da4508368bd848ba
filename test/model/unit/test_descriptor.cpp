/***
 * Name: test_descriptor
 * Purpose: Descriptor parsing into readable type names, owner normalisation, malformed input.
 */
#include <gtest/gtest.h>
#include <string>

#include "archlink/exceptions/descriptor_error.h"
#include "archlink/model/Descriptor.h"

using namespace archlink::model;
using archlink::exceptions::DescriptorError;

TEST(Descriptor, FieldTypes) {
  EXPECT_EQ(parseFieldDescriptor("I"), "int");
  EXPECT_EQ(parseFieldDescriptor("Ljava/lang/String;"), "java.lang.String");
  EXPECT_EQ(parseFieldDescriptor("[[J"), "long[][]");
  EXPECT_EQ(parseFieldDescriptor("[Lcom/example/Foo;"), "com.example.Foo[]");
}

TEST(Descriptor, MethodSignature) {
  const auto sig = parseMethodDescriptor("(ILjava/lang/String;[Z)Ljava/util/List;");
  ASSERT_EQ(sig.parameterTypes.size(), 3u);
  EXPECT_EQ(sig.parameterTypes[0], "int");
  EXPECT_EQ(sig.parameterTypes[1], "java.lang.String");
  EXPECT_EQ(sig.parameterTypes[2], "boolean[]");
  EXPECT_EQ(sig.returnType, "java.util.List");
  EXPECT_EQ(parseMethodDescriptor("()V").returnType, "void");
}

TEST(Descriptor, SignatureOfDispatchesOnKind) {
  EXPECT_EQ(signatureOf(MemberKind::Field, "D").returnType, "double");
  EXPECT_TRUE(signatureOf(MemberKind::Constructor, "()V").parameterTypes.empty());
  EXPECT_THROW(signatureOf(MemberKind::Field, "()V"), DescriptorError);
  EXPECT_THROW(signatureOf(MemberKind::Method, "I"), DescriptorError);
}

TEST(Descriptor, MalformedInputThrows) {
  EXPECT_THROW(parseFieldDescriptor(""), DescriptorError);
  EXPECT_THROW(parseFieldDescriptor("Q"), DescriptorError);
  EXPECT_THROW(parseFieldDescriptor("Ljava/lang/String"), DescriptorError);
  EXPECT_THROW(parseFieldDescriptor("II"), DescriptorError);
  EXPECT_THROW(parseMethodDescriptor("(I"), DescriptorError);
  EXPECT_THROW(parseMethodDescriptor("(I)VX"), DescriptorError);
  EXPECT_THROW(parseMethodDescriptor("(V)V"), DescriptorError);
}

TEST(Descriptor, ArrayDimensionsAreCapped) {
  const std::string deepest = std::string(255, '[') + "I";
  const auto name = parseFieldDescriptor(deepest);
  EXPECT_EQ(name.size(), std::string("int").size() + 2 * 255);
  EXPECT_THROW(parseFieldDescriptor(std::string(256, '[') + "I"), DescriptorError);
  EXPECT_THROW(parseFieldDescriptor(std::string(100000, '[') + "I"), DescriptorError);
  EXPECT_THROW(parseFieldDescriptor("[["), DescriptorError);
}

TEST(Descriptor, OwnerTypeName) {
  EXPECT_EQ(ownerTypeName("com/example/Foo"), "com.example.Foo");
  EXPECT_EQ(ownerTypeName("com.example.Foo"), "com.example.Foo");
  EXPECT_EQ(ownerTypeName("[Ljava/lang/Object;"), "java.lang.Object[]");
  EXPECT_EQ(ownerTypeName("[I"), "int[]");
  EXPECT_THROW(ownerTypeName(""), DescriptorError);
  EXPECT_THROW(ownerTypeName("[X"), DescriptorError);
}
