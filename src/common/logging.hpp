#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace inventory::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation id linking the events of one run; set it with
// CorrelationScope.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace inventory::logging

#define ILOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::inventory::logging::logEvent(::inventory::logging::LogLevel::Debug, \
                                   ::inventory::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::inventory::logging::logEvent(::inventory::logging::LogLevel::Info, \
                                   ::inventory::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::inventory::logging::logEvent(::inventory::logging::LogLevel::Warn, \
                                   ::inventory::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::inventory::logging::logEvent(::inventory::logging::LogLevel::Error, \
                                   ::inventory::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
