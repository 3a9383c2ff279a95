#include <chrono>
#include <sstream>
#include <string>
#include <thread>

#include "ScanScheduler_test.hpp"

#include "DeviceTracker.hpp"
#include "DistanceEstimator.hpp"
#include "FakeSources.hpp"
#include "ScanScheduler.hpp"
#include "SharedLog.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(ScanScheduler_test);

namespace
{
    struct Fixture
    {
        Fixture() :
            tracker(radio_source, address_source, identity_resolver, distance_estimator, log)
        {
            log.setOutputStream(log_output);
            radio_source.readings["AA:BB:CC:DD:EE:FF"] = -60.0;
        }

        std::ostringstream log_output;

        SharedLog log;

        FakeRadioSignalSource radio_source;

        FakeAddressResolutionSource address_source;

        FakeIdentityResolver identity_resolver;

        DistanceEstimator distance_estimator;

        DeviceTracker tracker;
    };

    // Polls until the scheduler reports the given status or the timeout passes
    bool waitForStatus(const ScanScheduler&             scheduler,
                       ScanScheduler::Status            status,
                       const std::chrono::milliseconds& timeout)
    {
        const std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + timeout;

        while (scheduler.getStatus() != status)
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return true;
    }

    // Polls until the radio source has been queried at least count times
    bool waitForQueries(const FakeRadioSignalSource&     radio_source,
                        unsigned int                     count,
                        const std::chrono::milliseconds& timeout)
    {
        const std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + timeout;

        while (radio_source.query_count < count)
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return true;
    }
}

//==============================================================================
void ScanScheduler_test::addTestCases()
{
    ADD_TEST_CASE(StartAndStop);
    ADD_TEST_CASE(StopInterruptsWait);
    ADD_TEST_CASE(StopWithoutStart);
    ADD_TEST_CASE(FailureHaltsScanning);
    ADD_TEST_CASE(UnrecognizedFailureHaltsScanning);
    ADD_TEST_CASE(StopGracePeriod);
}

//==============================================================================
Test::Result ScanScheduler_test::StartAndStop::body()
{
    Fixture fixture;
    fixture.tracker.updateSettings(1.0, 30.0);

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    MUST_BE_TRUE(scheduler.getStatus() == ScanScheduler::STOPPED);

    scheduler.start();
    MUST_BE_TRUE(scheduler.getStatus() == ScanScheduler::RUNNING);

    // Starting again changes nothing
    scheduler.start();

    // Scans repeat on the configured interval
    MUST_BE_TRUE(waitForQueries(fixture.radio_source, 2, std::chrono::milliseconds(5000)));
    MUST_BE_TRUE(fixture.tracker.snapshot(100.0).size() == 1);

    MUST_BE_TRUE(scheduler.stop());
    MUST_BE_TRUE(scheduler.getStatus() == ScanScheduler::STOPPED);

    // No more scans once stopped
    const unsigned int queries = fixture.radio_source.query_count;
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    MUST_BE_TRUE(fixture.radio_source.query_count == queries);

    const std::string log_text = fixture.log_output.str();
    MUST_BE_TRUE(log_text.find("Scanning started") != std::string::npos);
    MUST_BE_TRUE(log_text.find("Scanning stopped") != std::string::npos);

    return Test::PASSED;
}

//==============================================================================
Test::Result ScanScheduler_test::StopInterruptsWait::body()
{
    Fixture fixture;
    fixture.tracker.updateSettings(60.0, 30.0);

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    scheduler.start();

    MUST_BE_TRUE(waitForQueries(fixture.radio_source, 1, std::chrono::milliseconds(2000)));

    // The scheduler is now waiting a full minute for the next scan
    const std::chrono::steady_clock::time_point stop_started =
        std::chrono::steady_clock::now();
    MUST_BE_TRUE(scheduler.stop(std::chrono::milliseconds(2000)));
    MUST_BE_TRUE(std::chrono::steady_clock::now() - stop_started <
                 std::chrono::milliseconds(2000));

    MUST_BE_TRUE(fixture.radio_source.query_count == 1);

    // And it can be started again
    scheduler.start();
    MUST_BE_TRUE(waitForQueries(fixture.radio_source, 2, std::chrono::milliseconds(2000)));
    MUST_BE_TRUE(scheduler.stop());

    return Test::PASSED;
}

//==============================================================================
Test::Result ScanScheduler_test::StopWithoutStart::body()
{
    Fixture fixture;

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    MUST_BE_TRUE(scheduler.stop());
    MUST_BE_TRUE(scheduler.getStatus() == ScanScheduler::STOPPED);
    MUST_BE_TRUE(fixture.radio_source.query_count == 0);

    return Test::PASSED;
}

//==============================================================================
Test::Result ScanScheduler_test::FailureHaltsScanning::body()
{
    Fixture fixture;

    // Something to keep after scanning fails
    fixture.tracker.scan();
    MUST_BE_TRUE(fixture.tracker.snapshot(100.0).size() == 1);

    fixture.radio_source.throw_on_query = true;

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    scheduler.start();

    MUST_BE_TRUE(waitForStatus(scheduler,
                               ScanScheduler::FAILED,
                               std::chrono::milliseconds(5000)));

    MUST_BE_TRUE(fixture.tracker.snapshot(100.0).size() == 1);
    MUST_BE_TRUE(fixture.log_output.str().find("Scanning halted: Wireless adapter vanished") !=
                 std::string::npos);

    // The thread has already exited so stopping it is immediate
    MUST_BE_TRUE(scheduler.stop(std::chrono::milliseconds(500)));
    MUST_BE_TRUE(scheduler.getStatus() == ScanScheduler::FAILED);

    return Test::PASSED;
}

//==============================================================================
Test::Result ScanScheduler_test::StopGracePeriod::body()
{
    Fixture fixture;
    fixture.radio_source.delay = std::chrono::milliseconds(2000);

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    scheduler.start();

    // Stop while the first scan is still waiting on the radio
    MUST_BE_TRUE(waitForQueries(fixture.radio_source, 1, std::chrono::milliseconds(2000)));
    const bool stopped = scheduler.stop(std::chrono::milliseconds(100));

    // The abandoned thread still uses the fixture until its scan completes
    std::this_thread::sleep_for(std::chrono::milliseconds(3000));

    MUST_BE_TRUE(!stopped);
    MUST_BE_TRUE(fixture.log_output.str().find("did not stop in time") != std::string::npos);
    MUST_BE_TRUE(fixture.radio_source.query_count == 1);

    return Test::PASSED;
}

//==============================================================================
Test::Result ScanScheduler_test::UnrecognizedFailureHaltsScanning::body()
{
    Fixture fixture;
    fixture.radio_source.throw_unrecognized = true;

    ScanScheduler scheduler(fixture.tracker, fixture.log);
    scheduler.start();

    MUST_BE_TRUE(waitForStatus(scheduler,
                               ScanScheduler::FAILED,
                               std::chrono::milliseconds(5000)));
    MUST_BE_TRUE(fixture.log_output.str().find("Scanning halted") != std::string::npos);

    MUST_BE_TRUE(scheduler.stop(std::chrono::milliseconds(500)));
    MUST_BE_TRUE(fixture.radio_source.query_count == 1);

    return Test::PASSED;
}
