// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_LOGGING_H__
#define MIDDRAG_LOGGING_H__

#include "middrag/include/middrag.h"

// Everything below goes through middrag_log(), which the host must define.
// Assertions log and carry on; they never abort.

#define Assert(condition) \
  do { \
    if (!(condition)) \
      Err("Assertion '" #condition "' failed"); \
  } while(false)

#define AssertWithReturn(condition) \
  do { \
    if (!(condition)) { \
      Err("Assertion '" #condition "' failed"); \
      return; \
    } \
  } while(false)

#define AssertWithReturnValue(condition, returnValue) \
  do { \
    if (!(condition)) { \
      Err("Assertion '" #condition "' failed"); \
      return (returnValue); \
    } \
  } while(false)

#define Log(format, ...) \
  middrag_log(MIDDRAG_LOG_INFO, "INFO:%s:%d:" format "\n", \
              __FILE__, __LINE__, ## __VA_ARGS__)
#define Err(format, ...) \
  middrag_log(MIDDRAG_LOG_ERROR, "ERROR:%s:%d:" format "\n", \
              __FILE__, __LINE__, ## __VA_ARGS__)

#endif  // MIDDRAG_LOGGING_H__
