#include <iostream>

#include "argtree/argtree.hpp"

int main(int argc, char** argv) {
    using argtree::Arg;

    const argtree::App app(argtree::Command("export")
                               .about("Group, conflict and dependency example")
                               .arg(Arg("json").longName("json").takesValue(false).help("Write JSON"))
                               .arg(Arg("yaml").longName("yaml").takesValue(false).help("Write YAML"))
                               .arg(Arg("csv").longName("csv").takesValue(false).help("Write CSV"))
                               .group(argtree::ArgGroup("format").args({"json", "yaml", "csv"}).required(true))
                               .arg(Arg("output").shortName('o').longName("output").requiresArg("mode").help(
                                   "Output file"))
                               .arg(Arg("mode").longName("mode").possibleValues({"append", "truncate"}).help(
                                   "How to open the output file"))
                               .arg(Arg("stdout").longName("stdout").takesValue(false).conflictsWith("output").help(
                                   "Write to standard output")));

    const auto matches = app.getMatches(argc, argv);

    const char* format = matches.isPresent("json") ? "json" : matches.isPresent("yaml") ? "yaml" : "csv";
    std::cout << "format: " << format << "\n";
    if (const auto out = matches.valueOf("output")) {
        std::cout << "output: " << *out << " (" << *matches.valueOf("mode") << ")\n";
    } else {
        std::cout << "output: stdout\n";
    }
    return 0;
}
