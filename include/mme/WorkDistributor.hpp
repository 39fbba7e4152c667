#pragma once
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mme {

// Rule that assigns the linear pair indices to the processes
enum class Distribution {RoundRobin, Block};

// Rank owning the pair index under the round-robin rule: index mod worker_count
int owner(const uint64_t index, const int worker_count);
// Contiguous range [begin,end) of indices assigned to a rank when total indices are split in blocks. The first 
// (total mod worker_count) ranks get one extra index
void blockLimits(const uint64_t total, const int worker_count, const int worker_rank, uint64_t& begin, uint64_t& end);
// Parse "roundrobin" or "block"
Distribution parseDistribution(const std::string& name);

/**
 * The WorkDistributor class decides which pair indices of a pass are computed by the current process. 
 * The decision is a pure function of the index, the number of indices, the rank and the number of processes.
 */
class WorkDistributor {

    protected:
        Distribution distribution_;
        int procMPI_rank_;
        int procMPI_size_;

    public:  // Const references to attributes (read-only)
        const Distribution& distribution = distribution_;
        const int& procMPI_rank = procMPI_rank_;
        const int& procMPI_size = procMPI_size_;

    public:
        WorkDistributor(const Distribution distribution, const int procMPI_rank, const int procMPI_size);
        WorkDistributor(const WorkDistributor& other);
        ~WorkDistributor() = default;

        // Whether the pair index (out of total) is owned by this process
        bool owns(const uint64_t index, const uint64_t total) const;
        // Number of pair indices (out of total) owned by this process
        uint64_t ownedCount(const uint64_t total) const;

};

}
