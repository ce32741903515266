#pragma once
#include <filesystem>
#include <ostream>
#include <string>

namespace dslist {

// What the dslist command was asked to do, after argument parsing.
struct CommandOptions
{
    std::filesystem::path base;
    std::string printer;
    std::filesystem::path config;   // empty: no configuration to apply
    bool increaseGeneration = false;
    bool init = false;
    bool quiet = false;
};

/**
 * Loads the printer's target lists below `options.base`, applies the
 * configuration and generation bump, saves when anything changed and prints
 * the result to `out`.
 *
 * Changes to a generation that is already on disk go into a new generation,
 * even without `increaseGeneration`.
 *
 * Errors are reported on `err`. Returns the process exit status.
 */
int run(const CommandOptions& options, std::ostream& out, std::ostream& err);

} // namespace dslist
