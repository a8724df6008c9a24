#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <mutex>

// Serializes cout/cerr writes coming from evaluation threads
std::mutex &logMutex();

#endif // LOGGING_HPP
