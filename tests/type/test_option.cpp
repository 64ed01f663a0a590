#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <sstream>
#include <string>

#include "oxide/type/option.hpp"

namespace {

using namespace oxide::type;
using oxide::error::UnwrapFailure;

auto lookup(const std::map<std::string, int>& table, const std::string& key)
    -> Option<int> {
    auto it = table.find(key);
    if (it == table.end()) {
        return std::nullopt;
    }
    return present(it->second);
}

class OptionTest : public ::testing::Test {
protected:
    Option<int> some_ = present(5);
    Option<int> none_ = absent<int>();
};

TEST_F(OptionTest, Construction) {
    EXPECT_TRUE(some_.isPresent());
    EXPECT_FALSE(some_.isAbsent());
    EXPECT_TRUE(static_cast<bool>(some_));

    EXPECT_TRUE(none_.isAbsent());
    EXPECT_FALSE(static_cast<bool>(none_));

    Option<int> defaulted;
    EXPECT_TRUE(defaulted.isAbsent());

    Option<std::string> inPlace(std::in_place, 3, 'x');
    EXPECT_EQ(inPlace.unwrap(), "xxx");

    auto text = present("foo");
    static_assert(std::is_same_v<decltype(text), Option<std::string>>);
    EXPECT_EQ(text.unwrap(), "foo");
}

TEST_F(OptionTest, IsPresentAnd) {
    int calls = 0;
    auto isOdd = [&calls](int value) {
        ++calls;
        return value % 2 == 1;
    };
    EXPECT_TRUE(some_.isPresentAnd(isOdd));
    EXPECT_FALSE(none_.isPresentAnd(isOdd));
    EXPECT_EQ(calls, 1);
}

TEST_F(OptionTest, Unwrap) {
    EXPECT_EQ(some_.unwrap(), 5);
    EXPECT_THROW(static_cast<void>(none_.unwrap()), UnwrapFailure);

    try {
        static_cast<void>(none_.unwrap());
        FAIL() << "unwrap() on Absent did not throw";
    } catch (const UnwrapFailure& e) {
        EXPECT_THAT(e.getMessage(), ::testing::HasSubstr("Absent"));
    }
}

TEST_F(OptionTest, Expect) {
    EXPECT_EQ(some_.expect("value required"), 5);
    try {
        static_cast<void>(none_.expect("value required"));
        FAIL() << "expect() on Absent did not throw";
    } catch (const UnwrapFailure& e) {
        EXPECT_EQ(e.getMessage(), "value required");
    }
}

TEST_F(OptionTest, UnwrapOr) {
    EXPECT_EQ(some_.unwrapOr(0), 5);
    EXPECT_EQ(none_.unwrapOr(0), 0);

    int calls = 0;
    auto fallback = [&calls] {
        ++calls;
        return 42;
    };
    EXPECT_EQ(some_.unwrapOrElse(fallback), 5);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(none_.unwrapOrElse(fallback), 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(OptionTest, Map) {
    EXPECT_EQ(some_.map([](int x) { return x * 2; }), present(10));

    int calls = 0;
    auto mapped = none_.map([&calls](int x) {
        ++calls;
        return std::to_string(x);
    });
    static_assert(std::is_same_v<decltype(mapped), Option<std::string>>);
    EXPECT_TRUE(mapped.isAbsent());
    EXPECT_EQ(calls, 0);
}

TEST_F(OptionTest, MapOrAndMapOrElse) {
    auto negate = [](int x) { return -x; };
    EXPECT_EQ(some_.mapOr(0, negate), -5);
    EXPECT_EQ(none_.mapOr(0, negate), 0);

    int defaultCalls = 0;
    auto computeDefault = [&defaultCalls] {
        ++defaultCalls;
        return 100;
    };
    EXPECT_EQ(some_.mapOrElse(computeDefault, negate), -5);
    EXPECT_EQ(defaultCalls, 0);
    EXPECT_EQ(none_.mapOrElse(computeDefault, negate), 100);
    EXPECT_EQ(defaultCalls, 1);
}

TEST_F(OptionTest, InspectReturnsSameObject) {
    int seen = 0;
    const auto& returned = some_.inspect([&seen](int x) { seen = x; });
    EXPECT_EQ(&returned, &some_);
    EXPECT_EQ(seen, 5);

    int calls = 0;
    const auto& fromAbsent = none_.inspect([&calls](int) { ++calls; });
    EXPECT_EQ(&fromAbsent, &none_);
    EXPECT_EQ(calls, 0);
}

TEST_F(OptionTest, And) {
    Option<std::string> other = present("next");
    EXPECT_EQ(some_.and_(other), present("next"));
    EXPECT_TRUE(none_.and_(other).isAbsent());
    EXPECT_TRUE(some_.and_(absent<std::string>()).isAbsent());
}

TEST_F(OptionTest, AndThen) {
    const std::map<std::string, int> table{{"5", 50}};
    auto lookupKey = [&table](int key) {
        return lookup(table, std::to_string(key));
    };

    EXPECT_EQ(some_.andThen(lookupKey), present(50));
    EXPECT_TRUE(present(6).andThen(lookupKey).isAbsent());

    int calls = 0;
    auto result = none_.andThen([&calls](int x) {
        ++calls;
        return present(x);
    });
    EXPECT_TRUE(result.isAbsent());
    EXPECT_EQ(calls, 0);
}

TEST_F(OptionTest, Filter) {
    auto isOdd = [](int x) { return x % 2 == 1; };
    EXPECT_EQ(some_.filter(isOdd), some_);
    EXPECT_TRUE(present(4).filter(isOdd).isAbsent());

    int calls = 0;
    auto spy = [&calls](int) {
        ++calls;
        return true;
    };
    EXPECT_EQ(none_.filter(spy), none_);
    EXPECT_EQ(calls, 0);
}

TEST_F(OptionTest, Or) {
    EXPECT_EQ(some_.or_(present(1)), present(5));
    EXPECT_EQ(none_.or_(present(1)), present(1));
    EXPECT_TRUE(none_.or_(absent<int>()).isAbsent());

    int calls = 0;
    auto fallback = [&calls] {
        ++calls;
        return present(7);
    };
    EXPECT_EQ(some_.orElse(fallback), present(5));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(none_.orElse(fallback), present(7));
    EXPECT_EQ(calls, 1);
}

TEST_F(OptionTest, Xor) {
    EXPECT_EQ(some_.xor_(absent<int>()), some_);
    EXPECT_EQ(none_.xor_(present(3)), present(3));
    EXPECT_TRUE(some_.xor_(present(3)).isAbsent());
    EXPECT_TRUE(none_.xor_(absent<int>()).isAbsent());
}

TEST_F(OptionTest, Equality) {
    EXPECT_EQ(none_, absent<int>());
    EXPECT_EQ(some_, present(5));
    EXPECT_NE(some_, present(6));
    EXPECT_NE(some_, none_);

    EXPECT_TRUE(some_ == 5);
    EXPECT_TRUE(5 == some_);
    EXPECT_FALSE(none_ == 5);
    EXPECT_TRUE(none_ == std::nullopt);
    EXPECT_FALSE(some_ == std::nullopt);

    EXPECT_TRUE(present("foo") == "foo");
}

TEST_F(OptionTest, StreamOutput) {
    std::ostringstream oss;
    oss << some_ << " " << none_ << " " << present("x");
    EXPECT_EQ(oss.str(), "Present(5) Absent Present(x)");
}

}  // namespace
