#include "mme/CommunicatorMPI.hpp"

namespace mme {

CommunicatorMPI::CommunicatorMPI(MPI_Comm comm) : comm_{comm} {

    MPI_Comm_rank(comm_, &procMPI_rank_);
    MPI_Comm_size(comm_, &procMPI_size_);

}

/**
 * Element-wise sum of the matrix over all the processes, stored in every process.
 * @param buffer Local partial matrix, overwritten by the global sum.
 * @return void.
 */
void CommunicatorMPI::sumInPlace(arma::mat& buffer) const{

    // The shapes must agree before entering the collective call
    unsigned long long shape_loc[2] = {buffer.n_rows, buffer.n_cols};
    unsigned long long shape_min[2], shape_max[2];
    MPI_Allreduce(shape_loc, shape_min, 2, MPI_UNSIGNED_LONG_LONG, MPI_MIN, comm_);
    MPI_Allreduce(shape_loc, shape_max, 2, MPI_UNSIGNED_LONG_LONG, MPI_MAX, comm_);
    if(shape_min[0] != shape_max[0] || shape_min[1] != shape_max[1]){
        throw std::logic_error("ERROR CommunicatorMPI::sumInPlace: the partial matrices have different shapes across processes");
    }

    // Sum in chunks that fit in the int count of MPI
    const uint64_t chunk = 1ULL << 30;
    uint64_t n_elem = buffer.n_elem;
    for(uint64_t start = 0; start < n_elem; start += chunk){
        int count = static_cast<int>( std::min(chunk, n_elem - start) );
        MPI_Allreduce(MPI_IN_PLACE, buffer.memptr() + start, count, MPI_DOUBLE, MPI_SUM, comm_);
    }

}

void CommunicatorMPI::sumInPlace(PassCounters& counters) const{

    unsigned long long local[2] = {counters.G_count, counters.R_count};
    unsigned long long global[2];
    MPI_Allreduce(local, global, 2, MPI_UNSIGNED_LONG_LONG, MPI_SUM, comm_);
    counters.G_count = global[0];
    counters.R_count = global[1];

}

void CommunicatorMPI::barrier() const{

    MPI_Barrier(comm_);

}

}
