#include "common/FormatHelper.h"
#include <gtest/gtest.h>
#include <string>

namespace AFSM {

namespace {

enum class Color { Red = 0, Green = 1, Blue = 7 };

enum class Phase { Idle, Busy };

struct Opaque {
    int value = 0;
};

}  // namespace

}  // namespace AFSM

template <> struct fmt::formatter<AFSM::Phase> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext> auto format(AFSM::Phase phase, FormatContext &ctx) const {
        return fmt::formatter<fmt::string_view>::format(phase == AFSM::Phase::Idle ? "Idle" : "Busy", ctx);
    }
};

namespace AFSM {

TEST(FormatHelperTest, FormattableValuesUseTheirFormatter) {
    EXPECT_EQ(describe(42), "42");
    EXPECT_EQ(describe(std::string("Checkout")), "Checkout");
    EXPECT_EQ(describe(Phase::Busy), "Busy");
}

TEST(FormatHelperTest, EnumsWithoutFormatterUseUnderlyingValue) {
    EXPECT_EQ(describe(Color::Red), "0");
    EXPECT_EQ(describe(Color::Blue), "7");
}

TEST(FormatHelperTest, OtherTypesUsePlaceholder) {
    EXPECT_EQ(describe(Opaque{3}), "<value>");
}

}  // namespace AFSM
