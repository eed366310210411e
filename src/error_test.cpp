#include <gtest/gtest.h>
#include <mw/error.hpp>

#include "error.hpp"

TEST(Error, KindSurvivesRoundTrip)
{
    for(ErrorKind kind : {ErrorKind::VALIDATION, ErrorKind::AUTHORIZATION,
                          ErrorKind::NOT_FOUND, ErrorKind::STATE_CONFLICT,
                          ErrorKind::INACTIVE})
    {
        mw::Error e = ledgerError(kind, "nope");
        EXPECT_EQ(errorKind(e), kind);
        EXPECT_TRUE(isKind(e, kind));
        EXPECT_EQ(mw::errorMsg(e), "nope");
    }
}

TEST(Error, OtherErrorsHaveNoKind)
{
    EXPECT_EQ(errorKind(mw::runtimeError("disk on fire")), std::nullopt);
    EXPECT_EQ(errorKind(mw::httpError(500, "oops")), std::nullopt);
}

TEST(Error, KindsHaveNames)
{
    EXPECT_EQ(errorKindName(ErrorKind::STATE_CONFLICT), "StateConflict");
    EXPECT_EQ(errorKindName(ErrorKind::INACTIVE), "InactiveError");
}
