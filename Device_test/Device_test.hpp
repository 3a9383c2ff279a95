#if !defined DEVICE_TEST_HPP
#define DEVICE_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(Device_test)

    TEST(Constructor);
    TEST(HistoryIsBounded);
    TEST(AverageSignal);
    TEST(FillIfEmpty);

TEST_CASES_END(Device_test)

#endif
