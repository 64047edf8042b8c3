// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "locator_config.h"
#include "smilog.h"

#include <QtGlobal>

using namespace SmiLog;

namespace smi {
namespace system {

LocatorConfig LocatorConfig::fromEnvironment()
{
    LocatorConfig config;
    config.overridePath = qEnvironmentVariable("SMI_LOCATOR_PATH").trimmed();
    config.disabled = qEnvironmentVariableIsSet("SMI_LOCATOR_DISABLE");

    if (!config.overridePath.isEmpty())
        qCInfo(app) << "nvidia-smi path overridden by SMI_LOCATOR_PATH:" << config.overridePath;
    if (config.disabled)
        qCInfo(app) << "nvidia-smi discovery disabled by SMI_LOCATOR_DISABLE";
    return config;
}

} // namespace system
} // namespace smi
