#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <QCoreApplication>

int main(int argc, char **argv)
{
    // Qt network and socket classes expect an application instance.
    QCoreApplication app(argc, argv);
    return Catch::Session().run(argc, argv);
}
