/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <syslog.h>

#include "fastcommon/logger.h"

int main(int argc, char** argv) {
    log_init();
    // error paths are exercised on purpose, keep the output readable
    g_log_context.log_level = LOG_CRIT;

    ::testing::InitGoogleMock(&argc, argv);
    int result = RUN_ALL_TESTS();

    log_destroy();
    return result;
}
