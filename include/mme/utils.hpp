#pragma once
#include <iostream>
#include <omp.h>

namespace mme {

void printHeader();
void printParallelizationMPI(const int procMPI_size);

}
