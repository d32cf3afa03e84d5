#ifndef ARGTREE_ARGTREE_HPP
#define ARGTREE_ARGTREE_HPP

#include "argtree/app.hpp"
#include "argtree/arg.hpp"
#include "argtree/command.hpp"
#include "argtree/convert.hpp"
#include "argtree/error.hpp"
#include "argtree/help.hpp"
#include "argtree/matches.hpp"
#include "argtree/parser.hpp"
#include "argtree/raw_args.hpp"
#include "argtree/utils.hpp"
#include "argtree/validators.hpp"

#endif // ARGTREE_ARGTREE_HPP
