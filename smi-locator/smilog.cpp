// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "smilog.h"

namespace SmiLog {

Q_LOGGING_CATEGORY(app, "smi.locator")
Q_LOGGING_CATEGORY(probe, "smi.probe")

} // namespace SmiLog
