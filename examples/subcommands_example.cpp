#include <iostream>
#include <string>

#include "argtree/argtree.hpp"

namespace {

argtree::Command buildCli() {
    using argtree::Arg;
    using argtree::Command;

    Command commit("commit");
    commit.about("Record changes to the repository")
        .alias("ci")
        .arg(Arg("message").shortName('m').longName("message").required(true).help("Commit message"))
        .arg(Arg("amend").longName("amend").takesValue(false).help("Amend the previous commit"));

    Command remoteAdd("add");
    remoteAdd.about("Add a remote")
        .arg(Arg("name").index(0).required(true))
        .arg(Arg("url").index(1).required(true));

    Command remote("remote");
    remote.about("Manage remotes").subcommandRequired(true).subcommand(std::move(remoteAdd));

    Command root("vcs");
    root.about("A tiny version control front end")
        .version("1.0.0")
        .subcommandRequired(true)
        .arg(Arg("verbose").shortName('v').longName("verbose").takesValue(false).help("Verbose output"))
        .subcommands({std::move(commit), std::move(remote)});
    return root;
}

} // namespace

int main(int argc, char** argv) {
    const argtree::App app(buildCli());
    const auto matches = app.getMatches(argc, argv);
    const bool verbose = matches.isFlagSet("verbose");

    if (const auto* commit = matches.subcommandMatches("commit")) {
        if (verbose) std::cout << "[invoked as '" << *matches.subcommandName() << "']\n";
        std::cout << (commit->isFlagSet("amend") ? "amending: " : "committing: ") << *commit->valueOf("message")
                  << "\n";
        return 0;
    }

    if (const auto* remote = matches.subcommandMatches("remote")) {
        if (const auto* add = remote->subcommandMatches("add")) {
            std::cout << "remote " << *add->valueOf("name") << " -> " << *add->valueOf("url") << "\n";
        }
    }
    return 0;
}
