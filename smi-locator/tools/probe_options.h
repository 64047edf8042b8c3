// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_TOOLS_PROBE_OPTIONS_H
#define SMI_TOOLS_PROBE_OPTIONS_H

#include <QString>
#include <QStringList>

namespace smi {
namespace tools {

enum ProbeExitCode {
    ProbeFound = 0,
    ProbeNotFound = 1,
    ProbeUsageError = 2
};

struct ProbeOptions {
    int intervalMs {1000};
    bool disable {false};
    QString error;          // non-empty when the arguments were rejected

    bool isValid() const { return error.isEmpty(); }

    // Parses the arguments after the program name
    static ProbeOptions parse(const QStringList &args);
};

} // namespace tools
} // namespace smi

#endif // SMI_TOOLS_PROBE_OPTIONS_H
