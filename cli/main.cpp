// Layershift - Entry Point

#include "cli.h"

int main(int argc, char** argv) {
    return layershift::cli::handleCommand(argc, argv);
}
