#if !defined SCAN_SCHEDULER_TEST_HPP
#define SCAN_SCHEDULER_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(ScanScheduler_test)

    TEST(StartAndStop);
    TEST(StopInterruptsWait);
    TEST(StopWithoutStart);
    TEST(FailureHaltsScanning);
    TEST(UnrecognizedFailureHaltsScanning);
    TEST(StopGracePeriod);

TEST_CASES_END(ScanScheduler_test)

#endif
