// orfkit command-line entry point. Commands register themselves from
// cmd_translate.cpp, cmd_orf.cpp (orf, cds), cmd_nonstop.cpp and
// cmd_tables.cpp.

#include "subcommand.hpp"

int main(int argc, char* argv[]) {
    return orfkit::cli::SubcommandRegistry::instance().dispatch(argc, argv);
}
