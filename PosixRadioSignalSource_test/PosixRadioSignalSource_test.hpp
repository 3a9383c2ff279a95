#if !defined POSIX_RADIO_SIGNAL_SOURCE_TEST_HPP
#define POSIX_RADIO_SIGNAL_SOURCE_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(PosixRadioSignalSource_test)

    TEST(ParseScanOutput);
    TEST(ParseStationDump);
    TEST(ParseMalformedOutput);
    TEST(ParseMode);
    TEST(InvalidConstruction);
    TEST(MissingInterface);

TEST_CASES_END(PosixRadioSignalSource_test)

#endif
