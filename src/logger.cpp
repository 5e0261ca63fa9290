#include "logger.hpp"

LogLevel Logger::level = LogLevel::INFO;
