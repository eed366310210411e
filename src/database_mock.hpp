#pragma once
#include <gmock/gmock.h>
#include "database.hpp"

class DatabaseMock : public DatabaseInterface {
public:
    MOCK_METHOD(mw::E<void>, init, (), (override));
    MOCK_METHOD(mw::E<void>, appendAction, (const Action&), (override));
    MOCK_METHOD(mw::E<std::vector<Action>>, getActions, (uint64_t, int), (override));
    MOCK_METHOD(mw::E<uint64_t>, lastActionSeq, (), (override));
};
