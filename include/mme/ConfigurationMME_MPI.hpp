#pragma once
#include <mpi.h>
#include "mme/ConfigurationMME.hpp"

namespace mme {

/**
 * MPI version of ConfigurationMME: the processes read the file one after another.
 */
class ConfigurationMME_MPI : public ConfigurationMME {

    public:
        ConfigurationMME_MPI(const std::string& config_file, const int procMPI_rank, const int procMPI_size);

};

}
