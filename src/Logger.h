//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
#pragma once

#include <QString>
#include <QDebug>

#include <functional>

class AppLogHelper {
public:
    using Sink = std::function<void(bool isWarn, const QString& message)>;

    AppLogHelper(bool isWarn);
    ~AppLogHelper();
    QDebug stream() { return QDebug(&m_buffer).nospace(); }

    static void setGlobalDebugEnabled(bool enabled);
    static bool isGlobalDebugEnabled();

    // Installs a process-wide receiver for KF_LOG/KF_WARN lines. Pass an empty
    // function to fall back to qDebug/qWarning.
    static void setSink(Sink sink);

private:
    QString m_buffer;
    bool m_isWarn;
    static bool s_globalDebugEnabled;
};

#define KF_LOG AppLogHelper(false).stream()
#define KF_WARN AppLogHelper(true).stream()
#define KF_CLOG(category) (AppLogHelper(false).stream() << "[" #category "] ")
