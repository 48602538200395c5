#include "log_manager.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QThread>

#include <cstdio>
#include <cstdlib>

LogManager& LogManager::instance()
{
    static LogManager inst;
    return inst;
}

LogManager::LogManager(QObject* parent)
    : QObject(parent)
{
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flush);
}

LogManager::~LogManager()
{
    flush();
}

QString LogManager::defaultLogFilePath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (dir.isEmpty()) {
        dir = QDir::tempPath();
    }
    return dir + "/imseqvis.log";
}

void LogManager::install(const QString& logFilePath)
{
    openLogFile(logFilePath.isEmpty() ? defaultLogFilePath() : logFilePath);
    qInstallMessageHandler(logMessageHandler);
}

void LogManager::openLogFile(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_ts.setDevice(&m_file);
        m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
        m_ts.flush();
    } else {
        std::fprintf(stderr, "[LogManager] Cannot open log file %s\n", path.toLocal8Bit().constData());
    }
}

QStringList LogManager::logs() const
{
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level)
{
    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    const QString entry = QString("[%1] [%2] %3").arg(timestamp, level, message);
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(entry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
        if (m_ts.device()) {
            m_ts << entry << '\n';
            m_pendingFlush = true;
        }
    }

    if (m_echoToStderr) {
        std::fprintf(stderr, "%s\n", entry.toLocal8Bit().constData());
        std::fflush(stderr);
    }

    scheduleFlush(level);
    emit logAdded(entry);
}

void LogManager::scheduleFlush(const QString& level)
{
    const QString upper = level.toUpper();
    if (upper == "WARN" || upper == "ERROR" || upper == "FATAL") {
        flush();
        return;
    }
    // The flush timer belongs to the LogManager's thread
    if (QThread::currentThread() == thread()) {
        if (!m_flushTimer.isActive()) m_flushTimer.start();
    } else {
        QMetaObject::invokeMethod(this, [this]() {
            if (!m_flushTimer.isActive()) m_flushTimer.start();
        }, Qt::QueuedConnection);
    }
}

void LogManager::flush()
{
    QMutexLocker locker(&m_mutex);
    if (m_ts.device() && m_pendingFlush) {
        m_ts.flush();
    }
    m_pendingFlush = false;
}

void LogManager::clear()
{
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void logMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO"; break;
        case QtWarningMsg:  level = "WARN"; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        LogManager::instance().flush();
        std::abort();
    }
}
