// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/locator_config.h"

#include <gtest/gtest.h>

using namespace smi::system;

class UT_LocatorConfig : public ::testing::Test
{
protected:
    void SetUp() override
    {
        qunsetenv("SMI_LOCATOR_PATH");
        qunsetenv("SMI_LOCATOR_DISABLE");
    }
    void TearDown() override
    {
        qunsetenv("SMI_LOCATOR_PATH");
        qunsetenv("SMI_LOCATOR_DISABLE");
    }
};

TEST_F(UT_LocatorConfig, DefaultsWithoutEnvironment)
{
    const LocatorConfig config = LocatorConfig::fromEnvironment();
    EXPECT_TRUE(config.overridePath.isEmpty());
    EXPECT_FALSE(config.disabled);
}

TEST_F(UT_LocatorConfig, OverridePathTrimmed)
{
    qputenv("SMI_LOCATOR_PATH", "  /opt/nvidia/bin/nvidia-smi \n");
    const LocatorConfig config = LocatorConfig::fromEnvironment();
    EXPECT_EQ(config.overridePath, QStringLiteral("/opt/nvidia/bin/nvidia-smi"));
}

TEST_F(UT_LocatorConfig, DisableFlagAnyValue)
{
    qputenv("SMI_LOCATOR_DISABLE", "0");
    EXPECT_TRUE(LocatorConfig::fromEnvironment().disabled);
    qputenv("SMI_LOCATOR_DISABLE", "yes");
    EXPECT_TRUE(LocatorConfig::fromEnvironment().disabled);
}
