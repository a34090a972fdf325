#pragma once

#include <gtest/gtest.h>

/*
 * Runs every registered test after parsing the logging and random-seed options from the command
 * line. Each test executable's main() returns launch_gtest(argc, argv).
 *
 * --help prints those options before gtest's own help.
 */
int launch_gtest(int argc, char** argv);
