/**
 * @file    cli_app.hpp
 * @brief   CLI Application Interface
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace pwt::cli {

/**
 * Run the command-line front end
 * @return Process exit code (0 when every image succeeded)
 */
int run(int argc, char** argv);

}  // namespace pwt::cli
