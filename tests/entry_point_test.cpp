#include <gtest/gtest.h>

#include <string>

#include "runner/entry_point.hpp"
#include "runner/errors.hpp"
#include "test_support.hpp"

namespace ojrunner::runner {
namespace {

const char* kPackagedMain = R"(package com.example;

import java.util.Scanner;

public class Main {
    public static void main(String[] args) {
        System.out.println("hello");
    }
}
)";

TEST(EntryPointTest, DetectsPackageAndClass) {
    const auto entry = DetectEntryPoint(kPackagedMain);
    EXPECT_EQ(entry.main_class_name, "Main");
    ASSERT_TRUE(entry.package_name.has_value());
    EXPECT_EQ(*entry.package_name, "com.example");
    EXPECT_EQ(entry.QualifiedName(), "com.example.Main");
}

TEST(EntryPointTest, NoPackageGivesBareClassName) {
    const auto entry = DetectEntryPoint(
        "public class Solution {\n"
        "  public static void main(String... args) {}\n"
        "}\n");
    EXPECT_EQ(entry.main_class_name, "Solution");
    EXPECT_FALSE(entry.package_name.has_value());
    EXPECT_EQ(entry.QualifiedName(), "Solution");
}

TEST(EntryPointTest, PackageAfterBomAndIndentation) {
    const auto entry = DetectEntryPoint(
        "\xEF\xBB\xBF  package a.b_c.d ;\n"
        "public final class App { public static void main(String args[]) {} }\n");
    EXPECT_EQ(entry.QualifiedName(), "a.b_c.d.App");
}

TEST(EntryPointTest, PackageInsideCommentIsNotAtStatementPosition) {
    const auto entry = DetectEntryPoint(
        "// see package com.other; for details\n"
        "public class Main { public static void main(String[] a) {} }\n");
    EXPECT_FALSE(entry.package_name.has_value());
}

TEST(EntryPointTest, AcceptsStaticPublicOrder) {
    const auto entry = DetectEntryPoint(
        "public class Main { static public void main(final String[] args) {} }\n");
    EXPECT_EQ(entry.main_class_name, "Main");
}

TEST(EntryPointTest, AcceptsFinalBetweenModifiersAndQualifiedString) {
    EXPECT_EQ(DetectEntryPoint("public class A { public final static void main(String[] args) {} }\n")
                  .main_class_name,
              "A");
    EXPECT_EQ(DetectEntryPoint("public class B { public static void main(java.lang.String[] args) {} }\n")
                  .main_class_name,
              "B");
}

TEST(EntryPointTest, StaticWithoutPublicIsNotAnEntryMethod) {
    EXPECT_THROW(DetectEntryPoint("public class Main { static final void main(String[] args) {} }\n"),
                 EntryPointError);
}

TEST(EntryPointTest, MissingPublicClassFails) {
    try {
        DetectEntryPoint("class Main { public static void main(String[] args) {} }\n");
        FAIL() << "expected EntryPointError";
    } catch (const EntryPointError& ex) {
        EXPECT_NE(std::string(ex.what()).find("public entry class"), std::string::npos);
    }
}

TEST(EntryPointTest, MissingMainMethodFails) {
    try {
        DetectEntryPoint("public class Main { static void helper() {} }\n");
        FAIL() << "expected EntryPointError";
    } catch (const EntryPointError& ex) {
        EXPECT_NE(std::string(ex.what()).find("no runnable entry method"), std::string::npos);
    }
}

TEST(EntryPointTest, NonVoidMainIsNotAnEntryMethod) {
    EXPECT_THROW(
        DetectEntryPoint("public class Main { public static int main(String[] args) { return 0; } }\n"),
        EntryPointError);
}

TEST(EntryPointTest, ReadsFromFile) {
    testing::TempDir dir;
    const auto path = testing::WriteFile(dir.Path() / "Main.java", kPackagedMain);
    EXPECT_EQ(DetectEntryPointInFile(path).QualifiedName(), "com.example.Main");
}

TEST(EntryPointTest, UnreadableFileIsAValidationError) {
    testing::TempDir dir;
    EXPECT_THROW(DetectEntryPointInFile(dir.Path() / "Missing.java"), ValidationError);
}

}  // namespace
}  // namespace ojrunner::runner
