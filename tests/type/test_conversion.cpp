#include <gtest/gtest.h>

#include <string>

// Either header pulls in the other; start from Option on purpose.
#include "oxide/type/option.hpp"
#include "oxide/type/result.hpp"

namespace {

using namespace oxide::type;

class ConversionTest : public ::testing::Test {};

TEST_F(ConversionTest, OptionToResult) {
    EXPECT_EQ(present("foo").toResult("err").unwrap(), "foo");
    EXPECT_EQ(absent<std::string>().toResult("err").unwrapError(), "err");

    auto withCode = absent<int>().toResult(404);
    static_assert(std::is_same_v<decltype(withCode), Result<int, int>>);
    EXPECT_EQ(withCode, failure(404));
}

TEST_F(ConversionTest, OptionToResultElseIsLazy) {
    int calls = 0;
    auto makeError = [&calls] {
        ++calls;
        return std::string("missing");
    };

    EXPECT_EQ(present(1).toResultElse(makeError), success(1));
    EXPECT_EQ(calls, 0);

    EXPECT_EQ(absent<int>().toResultElse(makeError), failure("missing"));
    EXPECT_EQ(calls, 1);
}

TEST_F(ConversionTest, RoundTripThroughResult) {
    for (const auto& option : {present(8), absent<int>()}) {
        EXPECT_EQ(option.toResult("unused").toOption(), option);
    }
}

TEST_F(ConversionTest, ResultToOption) {
    Result<int, int> ok = success(1);
    Result<int, int> bad = failure(2);

    EXPECT_EQ(ok.toOption(), present(1));
    EXPECT_EQ(ok.errorAsOption(), absent<int>());
    EXPECT_EQ(bad.toOption(), absent<int>());
    EXPECT_EQ(bad.errorAsOption(), present(2));
}

TEST_F(ConversionTest, PipelineAcrossBothTypes) {
    auto parse = [](const std::string& text) -> Result<int> {
        if (text.empty() || text.find_first_not_of("0123456789") !=
                                std::string::npos) {
            return failure("not a number: " + text);
        }
        return success(std::stoi(text));
    };

    auto half = [&parse](const std::string& text) {
        return parse(text)
            .toOption()
            .filter([](int x) { return x % 2 == 0; })
            .map([](int x) { return x / 2; })
            .toResult("odd or invalid");
    };

    EXPECT_EQ(half("10"), success(5));
    EXPECT_EQ(half("7"), failure("odd or invalid"));
    EXPECT_EQ(half("x1"), failure("odd or invalid"));
}

}  // namespace
