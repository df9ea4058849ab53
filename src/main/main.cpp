#include "main/amber_cli.hpp"

int main(int argc, char** argv) {
    return amberMain(argc, argv);
}
