#include "prism/cli/app.hpp"

int main(int argc, char** argv) {
    prism::cli::App app;
    return app.run(argc, argv);
}
