/// @file log.hpp
/// @brief plog instance used by jsonpatch-cpp.
///
/// The library never initializes plog. Records go to the logger registered
/// under JSONPATCH_CPP_LOG_INSTANCE; if the host has not registered one,
/// every log statement is skipped.
///
/// @code
/// static plog::ConsoleAppender<plog::TxtFormatter> appender;
/// plog::init<jsonpatch_cpp::log_instance>(plog::verbose, &appender);
/// @endcode

#pragma once

#include <plog/Log.h>

#ifndef JSONPATCH_CPP_LOG_INSTANCE
#define JSONPATCH_CPP_LOG_INSTANCE 0
#endif

namespace jsonpatch_cpp {

/// The plog instance id all library records are written to.
inline constexpr int log_instance = JSONPATCH_CPP_LOG_INSTANCE;

}  // namespace jsonpatch_cpp
