#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    void initialize(const QString& logDir);

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void setMinimumLevel(Level level);
    Level minimumLevel() const;
    void setEchoToStderr(bool echo);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    Level m_minLevel = Info;
    bool m_echo = false;
    mutable QMutex m_mutex;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

#define LOG_CAT_DEBUG(cat, msg) LogManager::instance().log(LogManager::Debug, cat, msg)
#define LOG_CAT_INFO(cat, msg) LogManager::instance().log(LogManager::Info, cat, msg)
#define LOG_CAT_WARNING(cat, msg) LogManager::instance().log(LogManager::Warning, cat, msg)
#define LOG_CAT_ERROR(cat, msg) LogManager::instance().log(LogManager::Error, cat, msg)
