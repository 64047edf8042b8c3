// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/smi_locator.h"
#include "tools/probe_options.h"
#include "smilog.h"

#include <QTextStream>

using namespace smi::system;
using namespace smi::tools;
using namespace SmiLog;

int main(int argc, char **argv)
{
    // No QCoreApplication: QtConcurrent only needs the global thread pool.
    QTextStream out(stdout);
    QTextStream err(stderr);

    QStringList args;
    for (int i = 1; i < argc; ++i)
        args << QString::fromLocal8Bit(argv[i]);

    const ProbeOptions options = ProbeOptions::parse(args);
    if (!options.isValid()) {
        err << options.error << "\n";
        err << "Usage: smi-probe [--interval <ms>] [--disable]\n";
        return ProbeUsageError;
    }
    if (options.disable)
        qputenv("SMI_LOCATOR_DISABLE", "1");

    SmiLocator &locator = SmiLocator::instance();
    qCDebug(probe) << "Probing with interval" << options.intervalMs << "ms";

    out << "Platform: " << HostPlatform::name(locator.platform()) << "\n";
    const auto path = locator.resolve();
    if (!path) {
        out << "nvidia-smi: not found\n";
        out.flush();
        return ProbeNotFound;
    }
    out << "nvidia-smi: " << *path << "\n";
    out << "Command: " << *path << " " << SmiLocator::buildQueryArgs(options.intervalMs) << "\n";
    out << "Columns: " << SmiLocator::queryFields().join(", ") << "\n";
    out.flush();
    return ProbeFound;
}
