// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 detstab contributors

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
