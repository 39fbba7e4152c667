#include "mme/utils.hpp"

namespace mme {

void printHeader(){

    std::cout << "+---------------------------------------------------------------------------+" << std::endl;
    std::cout << "|                                    MME                                    |" << std::endl;
    std::cout << "|        Periodic 2-center Coulomb integrals with the minimax exponential   |" << std::endl;
    std::cout << "|                      expansion, in G space or R space                     |" << std::endl;
    std::cout << "+---------------------------------------------------------------------------+" << std::endl;

}

/**
 * Print the number of MPI processes and of OpenMP threads per process.
 * @param procMPI_size Total number of MPI processes.
 * @return void.
 */
void printParallelizationMPI(const int procMPI_size){

    std::cout << "MPI processes: " << procMPI_size << ". OpenMP threads per process: " << omp_get_max_threads() << std::endl;

}

}
