#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <utils.hpp>

#include <cstdlib>
#include <cstring>

int main(int argc, char** argv) {
    // STABLEMOUNT_TEST_LOG=1 shows DEBUG lines from the code under test
    bool verbose = false;
    if (const char* env = std::getenv("STABLEMOUNT_TEST_LOG")) {
        if (std::strcmp(env, "0") != 0)
            verbose = true;
    }
    stablemount::Logger::getInstance().init(verbose, "");

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
