// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/logging.h"

#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <ostream>

#include "base/immediate_crash.h"

namespace logging {

namespace {

const char* const log_severity_names[] = {"INFO", "WARNING", "ERROR", "FATAL"};
static_assert(LOGGING_NUM_SEVERITIES == std::size(log_severity_names),
              "Incorrect number of log_severity_names");

std::atomic<int> g_min_log_level{0};
std::atomic<int> g_vlog_level{0};

// The handler is installed once, normally from a test fixture, before any
// concurrent logging starts.
LogMessageHandlerFunction g_log_message_handler = nullptr;

}  // namespace

bool InitLogging(const LoggingSettings& settings) {
  if (settings.min_log_level > LOGGING_FATAL)
    return false;
  SetMinLogLevel(settings.min_log_level);
  SetVlogLevel(settings.vlog_level);
  return true;
}

void SetMinLogLevel(int level) {
  g_min_log_level = std::min(LOGGING_FATAL, level);
}

int GetMinLogLevel() {
  return g_min_log_level;
}

bool ShouldCreateLogMessage(int severity) {
  return severity >= g_min_log_level || severity == LOGGING_FATAL;
}

void SetVlogLevel(int level) {
  g_vlog_level = level;
}

int GetVlogVerbosity() {
  // VLOG(n) logs at severity -n, so a negative min log level also enables
  // verbose output.
  return std::max(g_vlog_level.load(), LOGGING_INFO - g_min_log_level.load());
}

void SetLogMessageHandler(LogMessageHandlerFunction handler) {
  g_log_message_handler = handler;
}

LogMessageHandlerFunction GetLogMessageHandler() {
  return g_log_message_handler;
}

const char* LogSeverityName(int severity) {
  if (severity >= 0 && severity < LOGGING_NUM_SEVERITIES)
    return log_severity_names[severity];
  return "VERBOSE";
}

LogMessage::LogMessage(const char* file, int line, LogSeverity severity)
    : severity_(severity), file_(file), line_(line) {
  Init(file, line);
}

LogMessage::LogMessage(const char* file, int line, const char* condition)
    : severity_(LOGGING_FATAL), file_(file), line_(line) {
  Init(file, line);
  stream_ << "Check failed: " << condition << ". ";
}

LogMessage::LogMessage(const char* file, int line, std::string* result)
    : severity_(LOGGING_FATAL), file_(file), line_(line) {
  Init(file, line);
  stream_ << "Check failed: " << *result;
  delete result;
}

LogMessage::~LogMessage() {
  stream_ << std::endl;
  std::string str_newline(stream_.str());

  // Give any log message handler first dibs on the message.
  bool handled = g_log_message_handler &&
                 g_log_message_handler(severity_, file_, line_, message_start_,
                                       str_newline);

  if (!handled) {
    fwrite(str_newline.data(), str_newline.size(), 1, stderr);
    fflush(stderr);
  }

  if (severity_ == LOGGING_FATAL) {
    // Crash the process to generate a dump.
    base::ImmediateCrash();
  }
}

// Writes the common header info to the stream.
void LogMessage::Init(const char* file, int line) {
  const char* last_slash_pos = strrchr(file, '/');
  const char* filename = last_slash_pos ? last_slash_pos + 1 : file;

  stream_ << '[';
  if (severity_ >= 0)
    stream_ << LogSeverityName(severity_);
  else
    stream_ << "VERBOSE" << -severity_;
  stream_ << ':' << filename << '(' << line << ")] ";
  message_start_ = stream_.str().length();
}

}  // namespace logging
