#include <chrono>

#include "DistanceMonitor.hpp"

int main(int argc, char** argv)
{
    DistanceMonitor distmon(argc, argv, std::chrono::milliseconds(100));
    return distmon.run();
}
