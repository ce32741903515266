#include "cli.hpp"
#include <iostream>
#include <string>
#include <argparse.hpp>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("dslist", "0.1.0", argparse::default_arguments::all);

    program.add_argument("base_path")
        .help("Directory holding the Version/ and Address/ folders")
        .required();

    program.add_argument("printer")
        .help("Hardware address of the printer, e.g. 00:00:74:aa:bb:cc")
        .required();

    program.add_argument("-c", "--config")
        .help("Load layout, destinations and senders from this configuration file")
        .default_value(std::string(""));

    program.add_argument("--increase-generation", "-g")
        .help("Start a new generation so the printer picks up the changes")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--init")
        .help("Start from empty lists if the printer has no stored state yet")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--quiet", "-q")
        .help("Do not print the resulting target lists")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    dslist::CommandOptions options;
    options.base = program.get<std::string>("base_path");
    options.printer = program.get<std::string>("printer");
    options.config = program.get<std::string>("--config");
    options.increaseGeneration = program.get<bool>("--increase-generation");
    options.init = program.get<bool>("--init");
    options.quiet = program.get<bool>("--quiet");

    return dslist::run(options, std::cout, std::cerr);
}
