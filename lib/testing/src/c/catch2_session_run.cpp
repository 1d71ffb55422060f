#include <catch2/catch_session.hpp>

auto main(int argc, char *argv[]) -> int {
    Catch::Session session;

    auto rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }

    return session.run();
}
