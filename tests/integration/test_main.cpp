#include <QCoreApplication>
#include <catch2/catch_session.hpp>

#include "crypto/token.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("qrhost_integration_tests");

    if (qrhost::crypto::init().is_err()) {
        return 1;
    }

    Catch::Session session;
    return session.run(argc, argv);
}
