#pragma once

#include "logger.h"

// Shared by the dht_responder*.cpp files
#define LOG_HANDLER_DEBUG(message) LOG_DEBUG("handler", message)
#define LOG_HANDLER_INFO(message)  LOG_INFO("handler", message)
#define LOG_HANDLER_WARN(message)  LOG_WARN("handler", message)
#define LOG_HANDLER_ERROR(message) LOG_ERROR("handler", message)
