// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "probe_options.h"

namespace smi {
namespace tools {

ProbeOptions ProbeOptions::parse(const QStringList &args)
{
    ProbeOptions options;
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == "--disable") {
            options.disable = true;
        } else if (arg == "--interval") {
            if (i + 1 >= args.size()) {
                options.error = QStringLiteral("Missing value for --interval");
                return options;
            }
            bool ok = false;
            const QString value = args.at(++i);
            options.intervalMs = value.toInt(&ok);
            if (!ok) {
                options.error = QString("Invalid interval: %1").arg(value);
                return options;
            }
        } else {
            options.error = QString("Unknown argument: %1").arg(arg);
            return options;
        }
    }
    return options;
}

} // namespace tools
} // namespace smi
