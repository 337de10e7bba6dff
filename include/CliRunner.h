#pragma once
#include <ostream>

/**
 * @brief Entry point behind main(): "YEAR SEED SIZE [options]".
 * @details Argument range violations are written to err as one "ERROR: ..."
 *          line each, followed by "USAGE: taxsynth --help". Pipeline failures
 *          are written as "ERROR: <message>". Progress and trace go to out.
 * @return 0 on success, 1 on any error.
 */
int runCli(int argc, char* argv[], std::ostream& out, std::ostream& err);
