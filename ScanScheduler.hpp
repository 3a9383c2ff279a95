#if !defined SCAN_SCHEDULER_HPP
#define SCAN_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

class DeviceTracker;
class SharedLog;

// Runs DeviceTracker scans back to back from a background thread, waiting the tracker's
// current scan interval between the end of one scan and the start of the next
class ScanScheduler
{
public:

    enum Status
    {
        // Never started, or stopped on request
        STOPPED,

        // Background thread is scanning or waiting to scan
        RUNNING,

        // A scan failed unrecoverably; no more scans will happen but the tracker keeps its
        // devices
        FAILED
    };

    ScanScheduler(DeviceTracker& device_tracker, SharedLog& log);

    // Stops scanning, allowing DEFAULT_STOP_GRACE_PERIOD for the current scan to finish
    ~ScanScheduler();

    // Starts the background thread; does nothing if it's already running
    void start();

    // Asks the background thread to stop and waits up to grace_period for it to do so.
    // Returns false if it didn't stop in time, in which case it's left to finish on its own.
    bool stop(const std::chrono::milliseconds& grace_period = DEFAULT_STOP_GRACE_PERIOD);

    Status getStatus() const;

    static const std::chrono::milliseconds DEFAULT_STOP_GRACE_PERIOD;

private:

    // State shared with the background thread, which may outlive this object if it doesn't
    // stop in time
    struct SharedState
    {
        SharedState();

        std::mutex state_mutex;

        std::condition_variable stop_requested_changed;

        bool stop_requested;

        Status status;
    };

    // Body of the background thread
    static void run(DeviceTracker&               device_tracker,
                    SharedLog&                   log,
                    std::shared_ptr<SharedState> state);

    DeviceTracker& device_tracker;

    SharedLog& log;

    std::shared_ptr<SharedState> state;

    std::thread scan_thread;

    // Becomes ready when the background thread exits
    std::future<void> scan_thread_done;

    ScanScheduler(const ScanScheduler&);
    ScanScheduler& operator=(const ScanScheduler&);
};

#endif
