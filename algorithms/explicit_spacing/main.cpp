#include <iostream>
#include "kspacing/drivers.hpp"

int main(int argc, char **argv)
{
    return kspacing::run_explicit_spacing(argc, argv, std::cout, std::cerr);
}
