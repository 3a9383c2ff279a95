#if !defined POSIX_ADDRESS_RESOLUTION_SOURCE_TEST_HPP
#define POSIX_ADDRESS_RESOLUTION_SOURCE_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(PosixAddressResolutionSource_test)

    TEST(SweepSmallSubnet);
    TEST(SweepLargeSubnet);
    TEST(SweepPointToPoint);
    TEST(InvalidConstruction);
    TEST(MissingInterface);
    TEST(ResolveHostnames);
    TEST(HostnameLookupDeadline);
    TEST(LoopbackAddresses);

TEST_CASES_END(PosixAddressResolutionSource_test)

#endif
