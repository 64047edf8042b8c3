// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_SYSTEM_LOCATOR_CONFIG_H
#define SMI_SYSTEM_LOCATOR_CONFIG_H

#include <QString>

namespace smi {
namespace system {

struct LocatorConfig {
    QString overridePath;   // used as-is when non-empty, no discovery
    bool disabled {false};  // resolve() always reports absence

    // SMI_LOCATOR_PATH, SMI_LOCATOR_DISABLE
    static LocatorConfig fromEnvironment();
};

} // namespace system
} // namespace smi

#endif // SMI_SYSTEM_LOCATOR_CONFIG_H
