#pragma once
#include "mme/Communicator.hpp"
#include <mpi.h>
#include <algorithm>

namespace mme {

/**
 * Process group of an MPI communicator. The reductions are MPI_Allreduce calls, so every process ends with the full result.
 */
class CommunicatorMPI : public Communicator {

    protected:
        MPI_Comm comm_;
        int procMPI_rank_;
        int procMPI_size_;

    public:
        CommunicatorMPI(MPI_Comm comm = MPI_COMM_WORLD);

        int procRank() const override { return procMPI_rank_; }
        int procSize() const override { return procMPI_size_; }
        void sumInPlace(arma::mat& buffer) const override;
        void sumInPlace(PassCounters& counters) const override;
        void barrier() const override;

};

}
