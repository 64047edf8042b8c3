// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_SYSTEM_FILESYSTEM_H
#define SMI_SYSTEM_FILESYSTEM_H

#include <QString>
#include <QStringList>

namespace smi {
namespace system {

/**
 * @brief Read-only file system queries used by executable discovery
 *
 * Implementations must tolerate concurrent calls from worker threads.
 * Every query reports failure through its return value; nothing is thrown.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Names of the subdirectories of @p path, without "." and ".."
    virtual bool listDirectories(const QString &path, QStringList &out) const = 0;
    // Names of every entry (files and directories) inside @p path
    virtual bool listEntries(const QString &path, QStringList &out) const = 0;
    // Creation time of @p filePath in ms since epoch
    virtual bool creationTime(const QString &filePath, qint64 &outMsecs) const = 0;
};

/**
 * @brief FileSystem backed by QDir and QFileInfo
 *
 * Creation time is the birth time when the platform records one, otherwise
 * the metadata change time.
 */
class QtFileSystem : public FileSystem {
public:
    bool listDirectories(const QString &path, QStringList &out) const override;
    bool listEntries(const QString &path, QStringList &out) const override;
    bool creationTime(const QString &filePath, qint64 &outMsecs) const override;
};

} // namespace system
} // namespace smi

#endif // SMI_SYSTEM_FILESYSTEM_H
