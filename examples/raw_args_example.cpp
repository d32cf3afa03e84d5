#include <iostream>

#include "argtree/raw_args.hpp"

int main(int argc, char** argv) {
    const auto args = argtree::RawArgs::parse(argc, argv);

    if (args.hasFlag("verbose") || args.hasFlag("v")) std::cout << "verbose mode\n";
    if (const auto file = args.getOption("file")) std::cout << "file: " << *file << "\n";

    for (const auto& p : args.positionals()) std::cout << "positional: " << p << "\n";
    return 0;
}
