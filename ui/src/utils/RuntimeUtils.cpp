#include "RuntimeUtils.hpp"

#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QStandardPaths>

#include <utility>

namespace hengjing::popup::utils {

QString runtimeDirectory()
{
    const QByteArray overrideDir = qgetenv("HENGJING_UI_RUNTIME_DIR");
    if (!overrideDir.isEmpty())
        return expandPath(QString::fromUtf8(overrideDir));

    QString base = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (base.isEmpty())
        base = QDir::tempPath();
    return QDir(base).filePath(QStringLiteral("hengjing"));
}

QString runtimeLockFilePath()
{
    const QByteArray overridePath = qgetenv("HENGJING_UI_LOCK_FILE");
    if (!overridePath.isEmpty())
        return expandPath(QString::fromUtf8(overridePath));
    return QDir(runtimeDirectory()).filePath(QStringLiteral("hengjing-ui.lock"));
}

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage)
{
    QDir directory = QFileInfo(lockPath).dir();
    if (directory.exists() || directory.mkpath(QStringLiteral(".")))
        return true;
    if (errorMessage)
        *errorMessage = QObject::tr("Cannot create the lock directory %1").arg(directory.absolutePath());
    return false;
}

QString describeLockConflict(const QString& lockPath, const LockConflictInfo& conflict)
{
    QString text = QObject::tr("Another popup instance already holds %1").arg(lockPath);
    if (conflict.pid > 0)
        text += QObject::tr(" (pid %1").arg(conflict.pid)
            + (conflict.hostname.isEmpty() ? QString() : QObject::tr(" on %1").arg(conflict.hostname))
            + QLatin1Char(')');
    return text;
}

SingleInstanceGuard::SingleInstanceGuard(QString lockFilePath)
    : m_lockFile(std::move(lockFilePath))
{
    m_lockFile.setStaleLockTime(0);
}

SingleInstanceGuard::~SingleInstanceGuard()
{
    release();
}

bool SingleInstanceGuard::tryAcquire(int timeoutMs)
{
    m_error.clear();
    m_conflict = {};
    m_lastError = QLockFile::NoError;

    if (m_locked)
        return true;

    if (m_lockFile.tryLock(timeoutMs)) {
        m_locked = true;
        return true;
    }

    m_lastError = m_lockFile.error();
    switch (m_lastError) {
    case QLockFile::LockFailedError:
        // A holder that died without unlocking leaves a stale file behind.
        if (m_lockFile.removeStaleLockFile() && m_lockFile.tryLock(timeoutMs)) {
            m_locked = true;
            m_lastError = QLockFile::NoError;
            return true;
        }
        m_lockFile.getLockInfo(&m_conflict.pid, &m_conflict.hostname, &m_conflict.applicationId);
        m_error = describeLockConflict(m_lockFile.fileName(), m_conflict);
        break;
    case QLockFile::PermissionError:
        m_error = QObject::tr("No permission to create the lock file %1").arg(m_lockFile.fileName());
        break;
    default:
        m_error = QObject::tr("Unexpected error while locking %1").arg(m_lockFile.fileName());
        break;
    }
    return false;
}

void SingleInstanceGuard::release()
{
    if (!m_locked)
        return;
    m_lockFile.unlock();
    m_locked = false;
}

} // namespace hengjing::popup::utils
