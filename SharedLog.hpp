#if !defined SHARED_LOG_HPP
#define SHARED_LOG_HPP

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

#include "Log.hpp"

// A Log that may be written from several threads at once, optionally writing to a file it owns
// so the file can be closed and reopened for log rotation without racing writers
class SharedLog
{
public:

    SharedLog();
    ~SharedLog();

    // Appends to the named file from now on; returns false if it couldn't be opened
    bool openFile(const std::string& filename);

    // Closes the file opened by openFile; messages are dropped until it's reopened
    void closeFile();

    // Writes to a stream owned by someone else from now on
    void setOutputStream(std::ostream& output_stream);

    void write(const std::string& message);

private:

    Log log;

    std::ofstream log_stream;

    std::mutex log_mutex;

    SharedLog(const SharedLog&);
    SharedLog& operator=(const SharedLog&);
};

#endif
