#include "mdpack/app.h"

int main(int argc, char** argv) {
    mdpack::App app;
    return app.run(argc, argv);
}
