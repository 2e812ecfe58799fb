#include <gtest/gtest.h>
#include <QCoreApplication>

// The pipeline posts queued calls to its worker thread, which needs an application object.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
