/*
 * Copyright 2025 Tether Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace tether::control {
struct LogConfig;
}

namespace tether::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Build the process logger from config ("stdout" or a log directory)
quill::Logger* init_logger(const tether::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Process logger; falls back to a console logger when none was configured
quill::Logger* logger();

// Logging macros for structured logging

// Request completion logging
#define TETHER_LOG_REQUEST(logger, method, path, status, duration_us, stream_id, correlation_id) \
    LOG_INFO(logger,                                                                              \
             "Request completed: method={}, path={}, status={}, "                                 \
             "duration_us={}, stream_id={}, correlation_id={}",                                   \
             method, path, status, duration_us, stream_id, correlation_id)

// Error logging with context
#define TETHER_LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)  \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Upstream lifecycle event logging
#define TETHER_LOG_UPSTREAM(logger, event, stream_id, response_id, upstream_host)       \
    LOG_INFO(logger, "Upstream {}: stream_id={}, response_id={}, upstream={}", event,   \
             stream_id, response_id, upstream_host)

}  // namespace tether::logging
