#ifndef ARGTREE_HELP_HPP
#define ARGTREE_HELP_HPP

#include <cstddef>
#include <string>

namespace argtree {

class Arg;
class Command;

// Entries narrower than this are padded before their description.
inline constexpr std::size_t kHelpColumnWidth = 30;

// Renders the full help page for one command level. Output depends only on the descriptor.
std::string generateHelp(const Command& cmd);

std::string buildUsageLine(const Command& cmd);

// "-o, --output <OUTPUT>" for options, "-v, --verbose" for flags, "<FILE>" for positionals.
std::string formatArgForHelp(const Arg& arg);

} // namespace argtree

#endif // ARGTREE_HELP_HPP
