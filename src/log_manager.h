#pragma once
#include <QFile>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

/**
 * Central sink for qDebug/qInfo/qWarning/qCritical output.
 *
 * install() routes Qt's message handler here. Every entry is timestamped,
 * kept in a bounded in-memory ring, mirrored to stderr and written through
 * to a log file. File writes are flushed at most every FLUSH_INTERVAL_MS,
 * except WARN/ERROR/FATAL which flush immediately.
 */
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    ~LogManager() override;

    // Installs the Qt message handler and opens logFilePath (empty: default location)
    void install(const QString& logFilePath = QString());

    QStringList logs() const;
    QString logFilePath() const { return m_file.fileName(); }
    void setEchoToStderr(bool echo) { m_echoToStderr = echo; }

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();
    void flush();

    static QString defaultLogFilePath();

signals:
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void scheduleFlush(const QString& level);
    void openLogFile(const QString& path);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    bool m_echoToStderr = true;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

void logMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
