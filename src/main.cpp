#include "Emulator.hpp"

int main(int argc, char* argv[]) {
    Emulator emulator;
    if (!emulator.init(argc, argv)) return 1;
    return emulator.run();
}
