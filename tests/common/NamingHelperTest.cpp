#include "common/NamingHelper.h"
#include <gtest/gtest.h>

using namespace ESM::NamingHelper;

TEST(NamingHelperTest, SnakeCaseSplitsBeforeEveryUppercaseLetter) {
    EXPECT_EQ(toSnakeCase("RedAmber"), "red_amber");
    EXPECT_EQ(toSnakeCase("Green"), "green");
    EXPECT_EQ(toSnakeCase("already_snake"), "already_snake");
    EXPECT_EQ(toSnakeCase("HTTPRequest"), "h_t_t_p_request");
    EXPECT_EQ(toSnakeCase(""), "");
}

TEST(NamingHelperTest, KeywordsAreEscapedWithTrailingUnderscore) {
    EXPECT_TRUE(isCppKeyword("delete"));
    EXPECT_TRUE(isCppKeyword("co_await"));
    EXPECT_FALSE(isCppKeyword("final"));
    EXPECT_FALSE(isCppKeyword("Delete"));

    EXPECT_EQ(escapeKeyword("delete"), "delete_");
    EXPECT_EQ(escapeKeyword("remove"), "remove");
}

TEST(NamingHelperTest, MethodNameResolution) {
    EXPECT_EQ(resolveMethodName(std::nullopt, "RedAmber", true), "red_amber");
    EXPECT_EQ(resolveMethodName(std::nullopt, "RedAmber", false), "RedAmber");
    EXPECT_EQ(resolveMethodName(std::string("go"), "RedAmber", true), "go");
    EXPECT_EQ(resolveMethodName(std::nullopt, "Delete", true), "delete_");
    EXPECT_EQ(resolveMethodName(std::string("new"), "Anything", false), "new_");
}

TEST(NamingHelperTest, IdentifierValidation) {
    EXPECT_TRUE(isValidIdentifier("Red"));
    EXPECT_TRUE(isValidIdentifier("_red2"));
    EXPECT_FALSE(isValidIdentifier(""));
    EXPECT_FALSE(isValidIdentifier("2red"));
    EXPECT_FALSE(isValidIdentifier("go.next"));

    EXPECT_TRUE(isImplementationReserved("_Red"));
    EXPECT_TRUE(isImplementationReserved("red__amber"));
    EXPECT_FALSE(isImplementationReserved("_red"));
}

TEST(NamingHelperTest, TypeExpressionsAreNormalized) {
    EXPECT_EQ(normalizeTypeExpression("  std::map<int,   std::string>  "), "std::map<int, std::string>");
    EXPECT_EQ(normalizeTypeExpression("unsigned\n\tlong"), "unsigned long");
    EXPECT_EQ(normalizeTypeExpression(""), "");
}

TEST(NamingHelperTest, UnqualifiedIdentifiersOfTypeExpressions) {
    EXPECT_EQ(unqualifiedIdentifiers("std::map<Key, ns::Value>"), (std::vector<std::string>{"std", "Key", "ns"}));
    EXPECT_EQ(unqualifiedIdentifiers("::Config"), std::vector<std::string>{});
    EXPECT_EQ(unqualifiedIdentifiers("a :: b"), std::vector<std::string>{"a"});
    EXPECT_EQ(unqualifiedIdentifiers("std::array<int, 4>"), (std::vector<std::string>{"std", "int"}));
}

TEST(NamingHelperTest, TemplateParameterNames) {
    EXPECT_EQ(templateParameterName("typename T"), "T");
    EXPECT_EQ(templateParameterName("class Cmp = std::less<T>"), "Cmp");
    EXPECT_EQ(templateParameterName("int N=4"), "N");
    EXPECT_EQ(templateParameterName("typename... Ts"), "Ts");
    EXPECT_EQ(templateParameterName("typename"), "");
    EXPECT_EQ(templateParameterName(""), "");
}
