#pragma once

#include <gtest/gtest.h>

// Dispatches to standard gtest main function, while adding LoggingUtil and Random cmdline params.
//
// Every unit-test binary defines main() as:
//
// int main(int argc, char** argv) { return launch_gtest(argc, argv); }
int launch_gtest(int argc, char** argv);
