// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "filesystem.h"
#include "smilog.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

using namespace SmiLog;

namespace smi {
namespace system {

bool QtFileSystem::listDirectories(const QString &path, QStringList &out) const
{
    QDir dir(path);
    if (!dir.exists() || !dir.isReadable()) {
        qCDebug(app) << "Directory not readable:" << path;
        return false;
    }
    out = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::NoSort);
    return true;
}

bool QtFileSystem::listEntries(const QString &path, QStringList &out) const
{
    QDir dir(path);
    if (!dir.exists() || !dir.isReadable()) {
        qCDebug(app) << "Directory not readable:" << path;
        return false;
    }
    out = dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::NoSort);
    return true;
}

bool QtFileSystem::creationTime(const QString &filePath, qint64 &outMsecs) const
{
    QFileInfo info(filePath);
    if (!info.exists()) return false;

    QDateTime created = info.birthTime();
    if (!created.isValid())
        created = info.metadataChangeTime();
    if (!created.isValid()) {
        qCDebug(app) << "No timestamp available for" << filePath;
        return false;
    }
    outMsecs = created.toMSecsSinceEpoch();
    return true;
}

} // namespace system
} // namespace smi
