#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Alg.h"
#include "CenterReductionSolver.h"
#include "Config.h"
#include "Cube.h"
#include "Errors.h"
#include "FaceTracker.h"
#include "Logger.h"
#include "Operator.h"

namespace {

struct Options {
    int size = 5;
    unsigned int seed = 1;
    std::string scramble;
    bool verbose = false;
    Config config;
};

void printUsage(const char* program) {
    std::cout << "usage: " << program << " [--size N] [--seed S] [--scramble \"ALG\"] [--cage] [--no-slices]\n"
              << "       [--no-blocks] [--check-boy] [--validate-trackers] [--verbose]\n";
}

Options parseArgs(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--size") {
            options.size = std::stoi(value());
        } else if (arg == "--seed") {
            options.seed = static_cast<unsigned int>(std::stoul(value()));
        } else if (arg == "--scramble") {
            options.scramble = value();
        } else if (arg == "--cage") {
            options.config.preserveCage = true;
        } else if (arg == "--no-slices") {
            options.config.searchCompleteSlices = false;
        } else if (arg == "--no-blocks") {
            options.config.searchBlocks = false;
        } else if (arg == "--check-boy") {
            options.config.sanityCheckIsBoy = true;
        } else if (arg == "--validate-trackers") {
            options.config.validateTrackers = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    Logger logger(std::cout, options.verbose ? LogLevel::Debug : LogLevel::Info);

    try {
        Cube cube(options.size);
        Operator op(cube, logger);

        Alg scramble = options.scramble.empty() ? Alg::scramble(options.size, options.seed)
                                                : Alg::parse(options.scramble);
        op.play(scramble);
        std::cout << "Scramble: " << scramble.toString() << "\n\n" << cube.dump() << "\n";

        if (cube.nSlices() == 0) {
            std::cout << "A 2x2 cube has no centers\n";
            return 0;
        }

        const long before = op.movesPlayed();
        {
            TrackerHolder holder(cube, options.config, logger);
            CenterReductionSolver solver(op, options.config, logger);
            solver.solve(holder);
            std::cout << "\nBlock commutators: " << solver.getBlockStatistics().toString() << "\n";
        }

        std::cout << "Moves: " << op.movesPlayed() - before << "\n\n" << cube.dump() << "\n";
        return CenterReductionSolver::isCubeSolved(cube) ? 0 : 1;
    } catch (const AlgParseError& e) {
        std::cerr << "Bad algorithm: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
