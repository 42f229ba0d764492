/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cli.h"

int main(int argc, char** argv) {
    return nska::cli::run(argc, argv);
}
