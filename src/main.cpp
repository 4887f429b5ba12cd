#include "gitadd/app.hpp"

int main(int argc, char** argv) {
    gitadd::App app;
    return app.run(argc, argv);
}
