#include "commands/convert.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "help") {
        return print_convert_usage(std::cout);
    }

    return cmd_convert(argc - 1, argv + 1);
}
