#include <QCoreApplication>
#include <QLoggingCategory>
#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    // Qt SQL drivers and QObject signals need an application instance
    QCoreApplication app(argc, argv);
    QLoggingCategory::setFilterRules("*.debug=false");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
