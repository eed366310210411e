#pragma once

#include <gtest/gtest.h>
#include <mw/error.hpp>
#include <mw/utils.hpp>

#define _ASSIGN_OR_FAIL(tmp, var, val)                                  \
    auto tmp = val;                                                     \
    ASSERT_TRUE(tmp.has_value()) << mw::errorMsg(tmp.error());          \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_FAIL(var, val)                                        \
    _ASSIGN_OR_FAIL(_CONCAT_NAMES(assign_or_fail_tmp, __COUNTER__), var, val)

#define EXPECT_KIND(result, kind)                                       \
    do                                                                  \
    {                                                                   \
        auto&& kind_res = (result);                                     \
        ASSERT_FALSE(kind_res.has_value());                             \
        EXPECT_EQ(errorKind(kind_res.error()), (kind))                  \
            << mw::errorMsg(kind_res.error());                          \
    } while(false)
