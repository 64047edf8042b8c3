// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "smi_locator.h"
#include "smilog.h"

#include <QAtomicInt>
#include <QDir>
#include <QMutexLocker>
#include <QtConcurrent>

#include <functional>

using namespace SmiLog;

namespace smi {
namespace system {

namespace {
const QString kWindowsExecutable = QStringLiteral("nvidia-smi.exe");
const QString kLinuxExecutable = QStringLiteral("nvidia-smi");
const QString kCsvFormat = QStringLiteral("--format=csv,noheader,nounits");
} // namespace

SmiLocator::SmiLocator(std::shared_ptr<FileSystem> fileSystem,
                       PlatformFamily platform,
                       const QString &homePath,
                       const LocatorConfig &config)
    : m_fileSystem(std::move(fileSystem))
    , m_platform(platform)
    , m_homePath(homePath)
    , m_config(config)
{
}

SmiLocator::~SmiLocator() = default;

SmiLocator &SmiLocator::instance()
{
    static SmiLocator locator(std::make_shared<QtFileSystem>(),
                              HostPlatform::current(),
                              QDir::homePath(),
                              LocatorConfig::fromEnvironment());
    return locator;
}

std::optional<QString> SmiLocator::resolve()
{
    QMutexLocker locker(&m_mutex);
    if (m_resolvedPath)
        return m_resolvedPath;

    std::optional<QString> found = discover();
    if (found) {
        qCInfo(app) << "Resolved nvidia-smi:" << *found;
        m_resolvedPath = found;
    }
    return found;
}

std::optional<QString> SmiLocator::discover() const
{
    if (m_config.disabled) {
        qCDebug(app) << "Discovery disabled by configuration";
        return std::nullopt;
    }
    if (!m_config.overridePath.isEmpty())
        return m_config.overridePath;

    switch (m_platform) {
    case PlatformFamily::Windows:
        return discoverInDriverStore();
    case PlatformFamily::Linux:
        return executableName(PlatformFamily::Linux);
    default:
        qCDebug(app) << "No nvidia-smi discovery for platform" << HostPlatform::name(m_platform);
        return std::nullopt;
    }
}

std::optional<QString> SmiLocator::discoverInDriverStore() const
{
    const QString basePath = HostPlatform::driverStorePath(m_homePath);

    QStringList dirs;
    if (!m_fileSystem->listDirectories(basePath, dirs)) {
        qCDebug(app) << "Cannot list driver store" << basePath;
        return std::nullopt;
    }

    // Probe every driver package concurrently; result keeps the listing order.
    // A package that cannot be listed fails the whole scan.
    const FileSystem *fs = m_fileSystem.get();
    const QString exeName = executableName(PlatformFamily::Windows);
    QAtomicInt listingFailed(0);
    std::function<bool(const QString &)> holdsExecutable = [fs, basePath, exeName, &listingFailed](const QString &dir) {
        QStringList entries;
        if (!fs->listEntries(basePath + '\\' + dir, entries)) {
            listingFailed.storeRelease(1);
            return false;
        }
        return entries.contains(exeName, Qt::CaseInsensitive);
    };
    const QStringList candidates = QtConcurrent::blockingFiltered(dirs, holdsExecutable);
    if (listingFailed.loadAcquire()) {
        qCDebug(app) << "Cannot list a driver package under" << basePath;
        return std::nullopt;
    }
    if (candidates.isEmpty()) {
        qCDebug(app) << "No nvidia-smi.exe under" << basePath;
        return std::nullopt;
    }

    // Newest executable wins, the earlier candidate keeps a tie
    QString best;
    qint64 bestCreated = 0;
    bool haveBest = false;
    for (const QString &dir : candidates) {
        const QString exe = basePath + '\\' + dir + '\\' + exeName;
        qint64 created = 0;
        if (!fs->creationTime(exe, created)) {
            qCDebug(app) << "No timestamp for" << exe;
            return std::nullopt;
        }
        if (!haveBest || created > bestCreated) {
            best = exe;
            bestCreated = created;
            haveBest = true;
        }
    }

    if (!haveBest)
        return std::nullopt;
    return best;
}

QString SmiLocator::buildQueryArgs(int intervalMs)
{
    return queryArguments(intervalMs).join(' ');
}

QStringList SmiLocator::queryArguments(int intervalMs)
{
    return QStringList() << "-lms"
                         << QString::number(intervalMs)
                         << "--query-gpu=" + queryFields().join(',')
                         << kCsvFormat;
}

QStringList SmiLocator::queryFields()
{
    return QStringList() << "name"
                         << "memory.total"
                         << "memory.used"
                         << "memory.free"
                         << "utilization.gpu"
                         << "utilization.memory";
}

QString SmiLocator::executableName(PlatformFamily platform)
{
    switch (platform) {
    case PlatformFamily::Windows: return kWindowsExecutable;
    case PlatformFamily::Linux: return kLinuxExecutable;
    default: return QString();
    }
}

} // namespace system
} // namespace smi
