#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "ScanScheduler.hpp"

#include "DeviceTracker.hpp"
#include "SharedLog.hpp"

const std::chrono::milliseconds ScanScheduler::DEFAULT_STOP_GRACE_PERIOD(3000);

//=============================================================================================
ScanScheduler::SharedState::SharedState() :
    stop_requested(false),
    status(STOPPED)
{
}

//=============================================================================================
ScanScheduler::ScanScheduler(DeviceTracker& device_tracker, SharedLog& log) :
    device_tracker(device_tracker),
    log(log),
    state(new SharedState())
{
}

//=============================================================================================
ScanScheduler::~ScanScheduler()
{
    stop();
}

//=============================================================================================
void ScanScheduler::start()
{
    if (scan_thread.joinable())
    {
        return;
    }

    // A thread left behind by an earlier stop that timed out keeps the old state
    state.reset(new SharedState());
    state->status = RUNNING;

    std::packaged_task<void()> task(
        std::bind(&ScanScheduler::run, std::ref(device_tracker), std::ref(log), state));
    scan_thread_done = task.get_future();
    scan_thread = std::thread(std::move(task));

    log.write("Scanning started");
}

//=============================================================================================
bool ScanScheduler::stop(const std::chrono::milliseconds& grace_period)
{
    if (!scan_thread.joinable())
    {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(state->state_mutex);
        state->stop_requested = true;
    }
    state->stop_requested_changed.notify_all();

    if (scan_thread_done.wait_for(grace_period) != std::future_status::ready)
    {
        log.write("Scanning did not stop in time, abandoning scan thread");
        scan_thread.detach();
        return false;
    }

    scan_thread.join();

    log.write("Scanning stopped");

    return true;
}

//=============================================================================================
ScanScheduler::Status ScanScheduler::getStatus() const
{
    std::lock_guard<std::mutex> lock(state->state_mutex);
    return state->status;
}

//=============================================================================================
// Scan failures the tracker can recover from never reach this function; anything that does
// ends scanning for good
//=============================================================================================
void ScanScheduler::run(DeviceTracker&               device_tracker,
                        SharedLog&                   log,
                        std::shared_ptr<SharedState> state)
{
    try
    {
        while (true)
        {
            {
                std::lock_guard<std::mutex> lock(state->state_mutex);
                if (state->stop_requested)
                {
                    break;
                }
            }

            device_tracker.scan();

            // Interval is read every cycle so settings changes apply to the next wait
            const std::chrono::duration<double> scan_interval(
                device_tracker.getSettings().scan_interval);

            std::unique_lock<std::mutex> lock(state->state_mutex);
            state->stop_requested_changed.wait_for(
                lock,
                scan_interval,
                [&state]() { return state->stop_requested; });
        }
    }
    catch (std::exception& ex)
    {
        log.write(std::string("Scanning halted: ") + ex.what());

        std::lock_guard<std::mutex> lock(state->state_mutex);
        state->status = FAILED;
        return;
    }
    catch (...)
    {
        log.write("Scanning halted: unrecognized exception");

        std::lock_guard<std::mutex> lock(state->state_mutex);
        state->status = FAILED;
        return;
    }

    std::lock_guard<std::mutex> lock(state->state_mutex);
    state->status = STOPPED;
}
