#include "toolroute/app/cli.hpp"

int main(int argc, char** argv) {
    return toolroute::app::run_cli(argc, argv);
}
