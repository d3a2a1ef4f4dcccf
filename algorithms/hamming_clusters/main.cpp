#include <iostream>
#include "kspacing/drivers.hpp"

int main(int argc, char **argv)
{
    return kspacing::run_hamming_clusters(argc, argv, std::cout, std::cerr);
}
