#include "mme/ConfigurationMME_MPI.hpp"

namespace mme {

/**
 * File constructor for ConfigurationMME_MPI. Each process parses the file in turn, separated by barriers.
 * @param config_file Name of the configuration file.
 * @param procMPI_rank Rank of the current MPI process.
 * @param procMPI_size Total number of MPI processes.
 */
ConfigurationMME_MPI::ConfigurationMME_MPI(const std::string& config_file, const int procMPI_rank, const int procMPI_size) {

    for(int r = 0; r < procMPI_size; r++){
        if(procMPI_rank == r){
            if(config_file.empty()){
                throw std::invalid_argument("ConfigurationMME_MPI: file must not be empty");
            }
            m_file.open(config_file.c_str());
            if(!m_file.is_open()){
                throw std::invalid_argument("ConfigurationMME_MPI: file " + config_file + " does not exist");
            }

            parseContent();

            m_file.close();
        }
        MPI_Barrier (MPI_COMM_WORLD);
    }

    checkContentCoherence();

}

}
