#include "logging.hpp"

std::mutex &logMutex()
{
    static std::mutex cout_mutex;
    return cout_mutex;
}
