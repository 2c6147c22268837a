#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& endpoint_logger();
log4cplus::Logger& codec_logger();
void init_logging(const std::string& config_path);
