#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "oxide/utils/to_string.hpp"

using namespace oxide::utils;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

class StreamableClass {
public:
    int value;
    explicit StreamableClass(int val) : value(val) {}

    friend std::ostream& operator<<(std::ostream& os,
                                    const StreamableClass& obj) {
        os << "StreamableClass(" << obj.value << ")";
        return os;
    }
};

class NonStreamableClass {
public:
    int value;
    explicit NonStreamableClass(int val) : value(val) {}
};

// Fails to render, to exercise in-place error reporting
class ThrowingClass {
public:
    friend std::ostream& operator<<(std::ostream& os, const ThrowingClass&) {
        os.setstate(std::ios::failbit);
        return os;
    }
};

// Throws from operator<< instead of setting failbit
class RaisingClass {
public:
    friend std::ostream& operator<<(std::ostream& os, const RaisingClass&) {
        throw std::runtime_error("printer broke");
        return os;
    }
};

enum class TestEnum { One = 1, Two = 2 };

}  // namespace

class ToStringTest : public ::testing::Test {};

TEST_F(ToStringTest, StringTypes) {
    std::string str = "hello";
    EXPECT_EQ(toString(str), "hello");

    const char* cstr = "hello";
    EXPECT_EQ(toString(cstr), "hello");

    std::string_view view = "hello";
    EXPECT_EQ(toString(view), "hello");

    const char* nullStr = nullptr;
    EXPECT_EQ(toString(nullStr), "null");

    EXPECT_EQ(toString(""), "");
}

TEST_F(ToStringTest, ScalarTypes) {
    EXPECT_EQ(toString('A'), "A");
    EXPECT_EQ(toString(true), "true");
    EXPECT_EQ(toString(false), "false");
    EXPECT_EQ(toString(42), "42");
    EXPECT_EQ(toString(TestEnum::Two), "2");
}

TEST_F(ToStringTest, PointerTypes) {
    int value = 42;
    int* ptr = &value;
    EXPECT_THAT(toString(ptr), StartsWith("Pointer("));
    EXPECT_THAT(toString(ptr), HasSubstr("42"));

    int* nullPtr = nullptr;
    EXPECT_EQ(toString(nullPtr), "nullptr");

    auto shared = std::make_shared<std::string>("shared");
    EXPECT_THAT(toString(shared), HasSubstr("shared"));

    std::unique_ptr<int> empty;
    EXPECT_EQ(toString(empty), "nullptr");
}

TEST_F(ToStringTest, Containers) {
    std::vector<int> numbers{1, 2, 3};
    EXPECT_EQ(toString(numbers), "[1, 2, 3]");
    EXPECT_EQ(toString(numbers, "|"), "[1|2|3]");
    EXPECT_EQ(toString(std::vector<int>{}), "[]");

    std::map<std::string, int> table{{"a", 1}, {"b", 2}};
    EXPECT_EQ(toString(table), "{a: 1, b: 2}");

    std::vector<std::vector<int>> nested{{1}, {2, 3}};
    EXPECT_EQ(toString(nested), "[[1], [2, 3]]");
}

TEST_F(ToStringTest, TuplesAndPairs) {
    EXPECT_EQ(toString(std::make_tuple(1, std::string("two"), 'c')),
              "(1, two, c)");
    EXPECT_EQ(toString(std::make_pair(std::string("key"), 7)), "(key, 7)");
}

TEST_F(ToStringTest, OptionalAndVariant) {
    EXPECT_EQ(toString(std::optional<int>(5)), "Optional(5)");
    EXPECT_EQ(toString(std::optional<int>()), "nullopt");

    std::variant<int, std::string> var = std::string("text");
    EXPECT_EQ(toString(var), "text");
}

TEST_F(ToStringTest, GeneralTypes) {
    EXPECT_EQ(toString(StreamableClass(3)), "StreamableClass(3)");
    EXPECT_THAT(toString(NonStreamableClass(3)), StartsWith("<unprintable"));
    EXPECT_THAT(toString(NonStreamableClass(3)),
                HasSubstr("NonStreamableClass"));
}

TEST_F(ToStringTest, FailingStreamRenderedAsError) {
    EXPECT_EQ(toString(ThrowingClass{}),
              "[Error: ToString conversion error: stream insertion failed]");
    EXPECT_EQ(toString(RaisingClass{}), "[Error: printer broke]");
    EXPECT_EQ(toString(std::optional<RaisingClass>(RaisingClass{})),
              "Optional([Error: printer broke])");
}

// A path is a range of paths; it must be printed as a whole
TEST_F(ToStringTest, SelfReferentialRangeUsesStream) {
    static_assert(!Container<std::filesystem::path>);

    const std::filesystem::path path("dir/file.txt");
    EXPECT_THAT(toString(path), HasSubstr("dir/file.txt"));

    std::vector<std::filesystem::path> paths{"a", "b"};
    EXPECT_THAT(toString(paths), HasSubstr("a"));
    EXPECT_THAT(toString(paths), StartsWith("["));
}

TEST_F(ToStringTest, FailedElementRenderedInPlace) {
    std::vector<ThrowingClass> items(2);
    EXPECT_EQ(toString(items),
              "[[Error: ToString conversion error: stream insertion failed], "
              "[Error: ToString conversion error: stream insertion failed]]");
    EXPECT_EQ(toString(std::vector<RaisingClass>(1)),
              "[[Error: printer broke]]");
}
