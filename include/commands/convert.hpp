#pragma once

#include <iostream>

// docs2md [input_dir] [output_dir] [--report <path>] [--log <path>]
// argv holds the arguments only (no program name).
int cmd_convert(int argc, char** argv, std::ostream& out = std::cout, std::ostream& err = std::cerr);

int print_convert_usage(std::ostream& os);
