// Test runner: the keepalive worker thread and sockets want a QCoreApplication around.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <QCoreApplication>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
