#include <iostream>
#include <string>

#include "argtree/argtree.hpp"

int main(int argc, char** argv) {
    argtree::App app(argtree::Command("greet")
                         .about("Prints a greeting")
                         .version("0.1.0")
                         .arg(argtree::Arg("name").index(0).required(true).help("Who to greet"))
                         .arg(argtree::Arg("greeting")
                                  .shortName('g')
                                  .longName("greeting")
                                  .defaultValue("Hello")
                                  .help("Greeting word"))
                         .arg(argtree::Arg("times")
                                  .shortName('n')
                                  .longName("times")
                                  .defaultValue("1")
                                  .validator(argtree::InRange(1, 10))
                                  .help("Repeat count"))
                         .arg(argtree::Arg("shout").shortName('s').longName("shout").takesValue(false).help("Uppercase output")));

    const auto matches = app.getMatches(argc, argv);

    std::string line = matches.get<std::string>("greeting") + ", " + *matches.valueOf("name") + "!";
    if (matches.isFlagSet("shout")) line = argtree::utils::toUpperAscii(line);

    const int times = matches.get<int>("times", 1);
    for (int i = 0; i < times; ++i) std::cout << line << "\n";
    return 0;
}
