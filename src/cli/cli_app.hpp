/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

namespace pdm::cli {

/**
 * Run the CLI application
 *
 * Values not given on the command line (or in --config) are asked
 * interactively.
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = completed, 1 = cancelled or fatal error)
 */
int run(int argc, char** argv);

}  // namespace pdm::cli
