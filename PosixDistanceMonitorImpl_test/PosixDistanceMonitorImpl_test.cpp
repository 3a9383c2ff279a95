#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "PosixDistanceMonitorImpl_test.hpp"

#include "PosixDistanceMonitorImpl.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(PosixDistanceMonitorImpl_test);

namespace
{
    // Reads a whole file; empty if it doesn't exist
    std::string readFile(const std::string& filename)
    {
        std::ifstream in_stream(filename.c_str());
        return std::string(std::istreambuf_iterator<char>(in_stream),
                           std::istreambuf_iterator<char>());
    }

    // Builds an argv out of arguments; arguments must outlive the result
    std::vector<char*> makeArgv(std::vector<std::string>& arguments)
    {
        std::vector<char*> argv;
        for (std::vector<std::string>::iterator i = arguments.begin();
             i != arguments.end();
             ++i)
        {
            argv.push_back(&(*i)[0]);
        }
        argv.push_back(0);

        return argv;
    }
}

//==============================================================================
void PosixDistanceMonitorImpl_test::addTestCases()
{
    ADD_TEST_CASE(Constructor);
    ADD_TEST_CASE(ConfiguredStartup);
    ADD_TEST_CASE(MalformedDefaultFile);
    ADD_TEST_CASE(ReloadKeepsArguments);
}

//==============================================================================
Test::Result PosixDistanceMonitorImpl_test::Constructor::body()
{
    try
    {
        PosixDistanceMonitorImpl distmon(0, 0, std::chrono::milliseconds(100));
    }
    catch (std::runtime_error& ex)
    {
        std::cout << ex.what() << "\n";
        return Test::SKIPPED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixDistanceMonitorImpl_test::ConfiguredStartup::body()
{
    char directory_template[] = "/tmp/distmon_testXXXXXX";
    if (!mkdtemp(directory_template))
    {
        return Test::SKIPPED;
    }
    const std::string directory(directory_template);

    const std::string default_filename = directory + "/config";
    const std::string devices_filename = directory + "/devices";
    const std::string log_filename     = directory + "/distmon.log";
    const std::string pid_filename     = directory + "/distmon.pid";
    const std::string report_filename  = directory + "/distmon.devices";

    std::ofstream default_stream(default_filename.c_str());
    default_stream << "# Test settings\n"
                   << "WIFI_INTERFACE=distmon_test0\n"
                   << "SCAN_INTERVAL=120\n"
                   << "DISTANCE_THRESHOLD=12\n"
                   << "REPORT_PERIOD=0.01\n"
                   << "RADIO_SCAN_TIMEOUT=1\n"
                   << "ARP_TIMEOUT=0.1\n"
                   << "NOT_A_SETTING=1\n";
    default_stream.close();

    std::ofstream devices_stream(devices_filename.c_str());
    devices_stream << "AA:BB:CC:DD:EE:FF Kitchen speaker\n"
                   << "garbage\n";
    devices_stream.close();

    std::vector<std::string> arguments;
    arguments.push_back("distmon");
    arguments.push_back("-d");
    arguments.push_back(default_filename);
    arguments.push_back("-c");
    arguments.push_back(devices_filename);
    arguments.push_back("-l");
    arguments.push_back(log_filename);
    arguments.push_back("--pidfile");
    arguments.push_back(pid_filename);
    arguments.push_back("--report");
    arguments.push_back(report_filename);
    std::vector<char*> argv = makeArgv(arguments);

    bool pid_written   = false;
    bool report_header = false;

    try
    {
        PosixDistanceMonitorImpl distmon(static_cast<int>(arguments.size()),
                                         &argv[0],
                                         std::chrono::milliseconds(100));

        pid_written = !readFile(pid_filename).empty();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        distmon.step();

        report_header = readFile(report_filename).find("# device\t") == 0;
    }
    catch (std::runtime_error& ex)
    {
        std::cout << ex.what() << "\n";
        return Test::SKIPPED;
    }

    const std::string log_text = readFile(log_filename);

    const bool pid_removed = access(pid_filename.c_str(), F_OK) != 0;

    unlink(default_filename.c_str());
    unlink(devices_filename.c_str());
    unlink(log_filename.c_str());
    unlink(report_filename.c_str());
    rmdir(directory.c_str());

    MUST_BE_TRUE(pid_written);
    MUST_BE_TRUE(report_header);
    MUST_BE_TRUE(pid_removed);
    MUST_BE_TRUE(log_text.find("Service starting on distmon_test0") != std::string::npos);
    MUST_BE_TRUE(log_text.find("Ignoring malformed line 2") != std::string::npos);
    MUST_BE_TRUE(log_text.find("scan interval 60s, distance threshold 12m") !=
                 std::string::npos);
    MUST_BE_TRUE(log_text.find("Service stopping") != std::string::npos);

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixDistanceMonitorImpl_test::MalformedDefaultFile::body()
{
    char directory_template[] = "/tmp/distmon_testXXXXXX";
    if (!mkdtemp(directory_template))
    {
        return Test::SKIPPED;
    }
    const std::string directory(directory_template);

    const std::string default_filename = directory + "/config";
    const std::string log_filename     = directory + "/distmon.log";

    std::ofstream default_stream(default_filename.c_str());
    default_stream << "WIFI_INTERFACE=distmon_test0\n"
                   << "PATH_LOSS_EXPONENT=steep\n";
    default_stream.close();

    std::vector<std::string> arguments;
    arguments.push_back("distmon");
    arguments.push_back("-d");
    arguments.push_back(default_filename);
    arguments.push_back("-l");
    arguments.push_back(log_filename);
    std::vector<char*> argv = makeArgv(arguments);

    bool threw = false;
    try
    {
        PosixDistanceMonitorImpl distmon(static_cast<int>(arguments.size()),
                                         &argv[0],
                                         std::chrono::milliseconds(100));
    }
    catch (std::runtime_error&)
    {
        threw = true;
    }

    unlink(default_filename.c_str());
    unlink(log_filename.c_str());
    rmdir(directory.c_str());

    MUST_BE_TRUE(threw);

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixDistanceMonitorImpl_test::ReloadKeepsArguments::body()
{
    char directory_template[] = "/tmp/distmon_testXXXXXX";
    if (!mkdtemp(directory_template))
    {
        return Test::SKIPPED;
    }
    const std::string directory(directory_template);

    const std::string default_filename = directory + "/config";
    const std::string log_filename     = directory + "/distmon.log";
    const std::string pid_filename     = directory + "/distmon.pid";
    const std::string report_filename  = directory + "/distmon.devices";
    const std::string ignored_log      = directory + "/ignored.log";
    const std::string ignored_pid      = directory + "/ignored.pid";

    // The defaults file names files the arguments override
    std::ofstream default_stream(default_filename.c_str());
    default_stream << "WIFI_INTERFACE=distmon_test0\n"
                   << "LOG_FILE=" << ignored_log << "\n"
                   << "PID_FILE=" << ignored_pid << "\n"
                   << "SCAN_INTERVAL=10\n"
                   << "RADIO_SCAN_TIMEOUT=1\n"
                   << "ARP_TIMEOUT=0.1\n"
                   << "HOSTNAME_TIMEOUT=0.1\n";
    default_stream.close();

    std::vector<std::string> arguments;
    arguments.push_back("distmon");
    arguments.push_back("-d");
    arguments.push_back(default_filename);
    arguments.push_back("-l");
    arguments.push_back(log_filename);
    arguments.push_back("--pidfile");
    arguments.push_back(pid_filename);
    arguments.push_back("--report");
    arguments.push_back(report_filename);
    std::vector<char*> argv = makeArgv(arguments);

    bool reloaded = false;

    try
    {
        PosixDistanceMonitorImpl distmon(static_cast<int>(arguments.size()),
                                         &argv[0],
                                         std::chrono::milliseconds(100));

        // Change a setting and ask for it to be reloaded
        default_stream.open(default_filename.c_str(), std::ofstream::trunc);
        default_stream << "WIFI_INTERFACE=distmon_test0\n"
                       << "LOG_FILE=" << ignored_log << "\n"
                       << "PID_FILE=" << ignored_pid << "\n"
                       << "SCAN_INTERVAL=20\n";
        default_stream.close();

        std::raise(SIGHUP);

        for (int i = 0; i < 20 && !reloaded; ++i)
        {
            distmon.step();
            reloaded = readFile(log_filename).find("scan interval 20s") != std::string::npos;

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    catch (std::runtime_error& ex)
    {
        std::cout << ex.what() << "\n";
        return Test::SKIPPED;
    }

    const std::string log_text = readFile(log_filename);

    // Shutdown removed the PID file the arguments named and logged to the log they named
    const bool pid_removed      = access(pid_filename.c_str(), F_OK) != 0;
    const bool ignored_log_made = access(ignored_log.c_str(), F_OK) == 0;
    const bool ignored_pid_made = access(ignored_pid.c_str(), F_OK) == 0;

    unlink(default_filename.c_str());
    unlink(log_filename.c_str());
    unlink(pid_filename.c_str());
    unlink(report_filename.c_str());
    unlink(ignored_log.c_str());
    unlink(ignored_pid.c_str());
    rmdir(directory.c_str());

    MUST_BE_TRUE(reloaded);
    MUST_BE_TRUE(pid_removed);
    MUST_BE_TRUE(!ignored_log_made);
    MUST_BE_TRUE(!ignored_pid_made);
    MUST_BE_TRUE(log_text.find("Service stopping") != std::string::npos);

    return Test::PASSED;
}
