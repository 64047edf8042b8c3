// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_LOG_H
#define SMI_LOG_H

#include <QLoggingCategory>

namespace SmiLog {

// Enable with QT_LOGGING_RULES="smi.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(app)
Q_DECLARE_LOGGING_CATEGORY(probe)

} // namespace SmiLog

#endif // SMI_LOG_H
