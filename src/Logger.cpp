//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
#include "Logger.h"

#include <QMutex>
#include <QMutexLocker>

bool AppLogHelper::s_globalDebugEnabled = false;

namespace {

QMutex& sinkMutex()
{
    static QMutex mutex;
    return mutex;
}

AppLogHelper::Sink& sinkSlot()
{
    static AppLogHelper::Sink sink;
    return sink;
}

} // namespace

AppLogHelper::AppLogHelper(bool isWarn)
    : m_isWarn(isWarn)
{
}

void AppLogHelper::setGlobalDebugEnabled(bool enabled)
{
    s_globalDebugEnabled = enabled;
}

bool AppLogHelper::isGlobalDebugEnabled()
{
    return s_globalDebugEnabled;
}

void AppLogHelper::setSink(Sink sink)
{
    QMutexLocker locker(&sinkMutex());
    sinkSlot() = std::move(sink);
}

AppLogHelper::~AppLogHelper()
{
    Sink sink;
    {
        QMutexLocker locker(&sinkMutex());
        sink = sinkSlot();
    }

    if (sink) {
        if (m_isWarn || s_globalDebugEnabled) {
            sink(m_isWarn, m_isWarn ? QStringLiteral("Warning: ") + m_buffer : m_buffer);
        }
        return;
    }

    // Headless fallback: warnings always go to the console, debug lines only
    // when global debug is enabled.
    if (m_isWarn) {
        qWarning().noquote() << m_buffer;
    } else if (s_globalDebugEnabled) {
        qDebug().noquote() << m_buffer;
    }
}
