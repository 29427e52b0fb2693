#include "clawguard/cli/app.hpp"

int main(int argc, char** argv) {
    clawguard::cli::App app;
    return app.run(argc, argv);
}
