#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

#include "SharedLog.hpp"

#include "Log.hpp"

//=============================================================================================
SharedLog::SharedLog()
{
    log.flushAfterWrite(true);
    log.useLocalTime();
}

//=============================================================================================
SharedLog::~SharedLog()
{
    closeFile();
}

//=============================================================================================
bool SharedLog::openFile(const std::string& filename)
{
    std::lock_guard<std::mutex> lock(log_mutex);

    if (log_stream.is_open())
    {
        log_stream.close();
    }

    log_stream.clear();
    log_stream.open(filename.c_str(), std::ofstream::app);
    if (log_stream.fail())
    {
        return false;
    }

    log.setOutputStream(log_stream);
    log.write("Log file open");

    return true;
}

//=============================================================================================
void SharedLog::closeFile()
{
    std::lock_guard<std::mutex> lock(log_mutex);

    if (log_stream.is_open())
    {
        log.write("Closing log file");
        log_stream.close();
    }
}

//=============================================================================================
void SharedLog::setOutputStream(std::ostream& output_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    log.setOutputStream(output_stream);
}

//=============================================================================================
void SharedLog::write(const std::string& message)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    log.write(message);
}
