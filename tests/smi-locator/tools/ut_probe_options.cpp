// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tools/probe_options.h"

#include <gtest/gtest.h>

using namespace smi::tools;

TEST(UT_ProbeOptions, Defaults)
{
    const ProbeOptions options = ProbeOptions::parse(QStringList());
    EXPECT_TRUE(options.isValid());
    EXPECT_EQ(options.intervalMs, 1000);
    EXPECT_FALSE(options.disable);
}

TEST(UT_ProbeOptions, IntervalAndDisable)
{
    const ProbeOptions options = ProbeOptions::parse({"--interval", "250", "--disable"});
    EXPECT_TRUE(options.isValid());
    EXPECT_EQ(options.intervalMs, 250);
    EXPECT_TRUE(options.disable);
}

TEST(UT_ProbeOptions, NegativeIntervalPassedThrough)
{
    const ProbeOptions options = ProbeOptions::parse({"--interval", "-5"});
    EXPECT_TRUE(options.isValid());
    EXPECT_EQ(options.intervalMs, -5);
}

TEST(UT_ProbeOptions, RejectsBadArguments)
{
    EXPECT_FALSE(ProbeOptions::parse({"--interval"}).isValid());
    EXPECT_FALSE(ProbeOptions::parse({"--interval", "fast"}).isValid());
    EXPECT_FALSE(ProbeOptions::parse({"--verbose"}).isValid());
}

TEST(UT_ProbeOptions, ExitCodes)
{
    EXPECT_EQ(ProbeFound, 0);
    EXPECT_EQ(ProbeNotFound, 1);
    EXPECT_EQ(ProbeUsageError, 2);
}
