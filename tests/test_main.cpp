#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>

int main(int argc, char** argv)
{
    // The store and engine only need an event-loop-free core application.
    QCoreApplication::setOrganizationName(QStringLiteral("KnowledgeFlowTests"));
    QCoreApplication::setApplicationName(QStringLiteral("knowledgeflow_tests"));
    QCoreApplication app(argc, argv);

    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(QStringLiteral("kf.*.debug=false"));
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
