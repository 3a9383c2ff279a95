#if !defined DEVICE_TRACKER_TEST_HPP
#define DEVICE_TRACKER_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(DeviceTracker_test)

    TEST(RadioDiscovery);
    TEST(AddressOnlyDiscovery);
    TEST(MergeAcrossScans);
    TEST(HistoryIsBounded);
    TEST(DistanceFromAverage);
    TEST(StaleDevicesEvicted);
    TEST(SnapshotThreshold);
    TEST(DisplayNames);
    TEST(SourceFailures);
    TEST(SettingsClamped);
    TEST(DeviceTypeRefinement);
    TEST(HostnameUpdates);
    TEST(ConcurrentSnapshots);
    TEST(DistanceKnownBeforeScanCompletes);
    TEST(NonFiniteSettingsIgnored);

TEST_CASES_END(DeviceTracker_test)

#endif
