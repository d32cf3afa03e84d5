#include <cstdint>
#include <iostream>
#include <variant>

#include "argtree/argtree.hpp"

// Try: APP_CONFIG=/etc/app.toml ./env_example --retries 5 --tags "a, b"
int main(int argc, char** argv) {
    using argtree::Arg;

    const argtree::App app(argtree::Command("env_example")
                               .about("Environment and default fallback")
                               .arg(Arg("config")
                                        .shortName('c')
                                        .longName("config")
                                        .env("APP_CONFIG")
                                        .defaultValue("config.toml")
                                        .help("Configuration file"))
                               .arg(Arg("retries")
                                        .longName("retries")
                                        .env("APP_RETRIES")
                                        .defaultValue("3")
                                        .validator(argtree::IsUnsigned())
                                        .help("Retry budget"))
                               .arg(Arg("tags").longName("tags").valueDelimiter(',').help("Comma separated tags")));

    const auto matches = app.getMatches(argc, argv);

    std::cout << "config:  " << *matches.valueOf("config") << "\n";
    // Backfilled values skip the validator, so a bad APP_RETRIES only surfaces on conversion.
    const auto retries = matches.valueAs<std::uint64_t>("retries");
    if (const auto* err = std::get_if<argtree::CommandError>(&retries)) return app.report(*err);
    std::cout << "retries: " << std::get<std::uint64_t>(retries) << "\n";
    if (const auto tags = matches.valuesOf("tags")) {
        std::cout << "tags:    " << argtree::utils::join(*tags, " | ") << "\n";
    }
    return 0;
}
