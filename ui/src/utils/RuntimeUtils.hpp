#pragma once

#include <QLockFile>
#include <QString>

namespace hengjing::popup::utils {

struct LockConflictInfo {
    qint64 pid = 0;
    QString hostname;
    QString applicationId;
};

//! Directory for the lock file; HENGJING_UI_RUNTIME_DIR overrides the platform runtime location.
QString runtimeDirectory();

//! Lock file guarding the resident popup; HENGJING_UI_LOCK_FILE overrides the full path.
QString runtimeLockFilePath();

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage = nullptr);

//! Human readable description of the process holding the lock.
QString describeLockConflict(const QString& lockPath, const LockConflictInfo& conflict);

class SingleInstanceGuard {
public:
    explicit SingleInstanceGuard(QString lockFilePath);
    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;
    ~SingleInstanceGuard();

    bool tryAcquire(int timeoutMs = 0);
    void release();
    bool isHeld() const { return m_locked; }
    bool hasConflict() const { return m_lastError == QLockFile::LockFailedError; }
    QString errorString() const { return m_error; }
    LockConflictInfo conflictInfo() const { return m_conflict; }
    QString lockFilePath() const { return m_lockFile.fileName(); }

private:
    QLockFile m_lockFile;
    QString m_error;
    LockConflictInfo m_conflict;
    bool m_locked = false;
    QLockFile::LockError m_lastError = QLockFile::NoError;
};

} // namespace hengjing::popup::utils
