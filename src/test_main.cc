// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include <gtest/gtest.h>

#include "middrag/include/middrag.h"

namespace {
// Set by --verbose. Errors are always printed.
bool g_verbose = false;
}  // namespace {}

void middrag_log(int verb, const char* format, ...) {
  if (verb > MIDDRAG_LOG_ERROR && !g_verbose)
    return;
  va_list args;
  va_start(args, format);
  vfprintf(stderr, format, args);
  va_end(args);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  for (int i = 1; i < argc; i++)
    if (strcmp(argv[i], "--verbose") == 0)
      g_verbose = true;
  return RUN_ALL_TESTS();
}
