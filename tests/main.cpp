#include <gtest/gtest.h>
#include <QCoreApplication>

int main(int argc, char *argv[])
{
    //command line parsing needs an application instance for its help text
    QCoreApplication a(argc, argv);
    a.setApplicationName("phylorange_tests");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
