#include "cli.hpp"
#include "config_file.hpp"
#include "target_list.hpp"
#include <exception>

namespace dslist {

int run(const CommandOptions& options, std::ostream& out, std::ostream& err) {
    try {
        TargetList targets(options.printer);
        bool published = false;
        bool changed = false;

        if (targets.exists(options.base)) {
            targets.load(options.base);
            published = true;
        } else if (options.init) {
            out << "No stored target lists for " << targets.printer_identifier()
                << ", starting fresh\n";
            changed = true;
        } else {
            err << "Error: no stored target lists for " << targets.printer_identifier()
                << " below " << options.base << " (use --init to create them)\n";
            return 1;
        }

        if (!options.config.empty()) {
            out << "Loading configuration " << options.config << "...\n";
            targets.load_config(ConfigFile::load(options.config));
            changed = true;
        }

        if (options.increaseGeneration || (changed && published)) {
            targets.increase_generation();
            changed = true;
        }

        if (changed) {
            targets.save(options.base);
            out << "Wrote generation " << targets.generation().generation_number()
                << " to " << targets.version_path(options.base) << "\n";
        }

        if (!options.quiet) {
            out << targets << "\n";
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace dslist
