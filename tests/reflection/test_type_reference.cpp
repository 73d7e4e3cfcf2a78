/**
 * @file test_type_reference.cpp
 * @brief Unit tests for TypeReference capture
 */

#include <gtest/gtest.h>

#include "reflection/TypeReference.hpp"

#include "mocks/MockServices.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace Beacon;
using namespace Beacon::Reflect;
using namespace Beacon::Test;

namespace {

// Named carriers, declared the way call sites spell them
struct NameList : TypeReference<std::vector<std::string>> {};
struct ScoreTable : TypeReference<std::map<std::string, int>> {};

// Declared without a type argument
struct RawReference : TypeReference<> {};

} // namespace

// =============================================================================
// Capture Tests
// =============================================================================

TEST(TypeReferenceTest, CapturesVectorOfStrings) {
    TypeReference<std::vector<std::string>> reference;

    const auto& captured = reference.GetDescriptor();
    EXPECT_EQ(TypeDescriptor::Of<std::vector<std::string>>(), captured);
    ASSERT_TRUE(captured.IsParameterized());
    EXPECT_EQ(TypeDescriptor::Of<std::string>(), captured.GetArgument(0));
}

TEST(TypeReferenceTest, CapturesMapArguments) {
    TypeReference<std::map<std::string, int>> reference;

    const auto& captured = reference.GetDescriptor();
    EXPECT_EQ((TypeDescriptor::Of<std::map<std::string, int>>()), captured);
    EXPECT_EQ(TypeDescriptor::Of<std::string>(), captured.GetArgument(0));
    EXPECT_EQ(TypeDescriptor::Of<int>(), captured.GetArgument(1));
}

TEST(TypeReferenceTest, CapturesUserTemplate) {
    TypeReference<Repository<int>> reference;

    EXPECT_EQ(TypeDescriptor::Of<Repository<int>>(), reference.GetDescriptor());
    EXPECT_NE(TypeDescriptor::Of<Repository<std::string>>(), reference.GetDescriptor());
}

TEST(TypeReferenceTest, CapturesPlainType) {
    TypeReference<IClock> reference;

    EXPECT_EQ(TypeDescriptor::Of<IClock>(), reference.GetDescriptor());
    EXPECT_FALSE(reference.GetDescriptor().IsParameterized());
}

TEST(TypeReferenceTest, NamedCarrierReadsArgumentFromBase) {
    NameList names;
    ScoreTable scores;

    EXPECT_EQ(TypeDescriptor::Of<std::vector<std::string>>(), names.GetDescriptor());
    EXPECT_EQ((TypeDescriptor::Of<std::map<std::string, int>>()), scores.GetDescriptor());
}

TEST(TypeReferenceTest, DistinctSpecializationsCaptureDistinctDescriptors) {
    EXPECT_NE(TypeReference<std::vector<std::string>>().GetDescriptor(),
              TypeReference<std::vector<int>>().GetDescriptor());
}

TEST(TypeReferenceTest, CopyKeepsDescriptor) {
    TypeReference<Repository<std::string>> original;
    TypeReference<Repository<std::string>> copy = original;

    EXPECT_EQ(original.GetDescriptor(), copy.GetDescriptor());
    EXPECT_EQ(original.GetDescriptor().GetName(), copy.GetDescriptor().GetName());
}

TEST(TypeReferenceTest, ExposesCapturedType) {
    static_assert(std::is_same_v<TypeReference<std::vector<int>>::Type, std::vector<int>>);
    static_assert(std::is_same_v<NameList::Type, std::vector<std::string>>);
    SUCCEED();
}

// =============================================================================
// Missing Type Parameter Tests
// =============================================================================

TEST(TypeReferenceTest, UnparameterizedCarrierThrows) {
    EXPECT_THROW(TypeReference<>{}, MissingTypeParameterError);
}

TEST(TypeReferenceTest, UnparameterizedCarrierThrowsOnHeap) {
    EXPECT_THROW((void)std::make_unique<TypeReference<>>(), MissingTypeParameterError);
}

TEST(TypeReferenceTest, UnparameterizedNamedCarrierThrows) {
    EXPECT_THROW(RawReference{}, MissingTypeParameterError);
}

TEST(TypeReferenceTest, MissingParameterErrorNamesCarrier) {
    try {
        RawReference reference;
        FAIL() << "Expected MissingTypeParameterError";
    } catch (const MissingTypeParameterError& e) {
        EXPECT_NE(std::string::npos, e.GetFoundType().find("TypeReference"));
        EXPECT_NE(std::string::npos, std::string(e.what()).find("Missing type parameter. Found: "));
    }
}

TEST(TypeReferenceTest, MissingParameterIsLogicError) {
    EXPECT_THROW(TypeReference<>{}, std::logic_error);
}
