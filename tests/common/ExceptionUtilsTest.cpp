#include "common/ExceptionUtils.h"
#include "common/HandlerEscalation.h"
#include <exception>
#include <gtest/gtest.h>
#include <stdexcept>

namespace AFSM {

TEST(ExceptionUtilsTest, NullFailure) {
    EXPECT_EQ(describeException(nullptr), "no exception");
}

TEST(ExceptionUtilsTest, StandardExceptionsUseWhat) {
    EXPECT_EQ(describeException(std::make_exception_ptr(std::runtime_error("disk full"))), "disk full");
    EXPECT_EQ(describeException(std::make_exception_ptr(HandlerEscalation("escalated"))), "escalated");
}

TEST(ExceptionUtilsTest, NonStandardExceptionsAreUnknown) {
    EXPECT_EQ(describeException(std::make_exception_ptr(17)), "unknown exception");
}

TEST(HandlerEscalationTest, KeepsCause) {
    auto cause = std::make_exception_ptr(std::invalid_argument("bad quantity"));
    HandlerEscalation escalation("Handler 'reserve' should neither throw nor handle exceptions", cause);

    EXPECT_STREQ(escalation.what(), "Handler 'reserve' should neither throw nor handle exceptions");
    EXPECT_EQ(escalation.cause(), cause);
    EXPECT_EQ(escalation.causeMessage(), "bad quantity");
}

}  // namespace AFSM
