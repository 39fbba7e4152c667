#include "mme/WorkDistributor.hpp"

namespace mme {

int owner(const uint64_t index, const int worker_count){

    if(worker_count <= 0){
        throw std::invalid_argument("ERROR owner: the number of workers must be positive");
    }
    return static_cast<int>(index % static_cast<uint64_t>(worker_count));

}

/**
 * Contiguous block of indices of a rank. The first (total mod worker_count) ranks get one index more than the rest.
 * @param total Number of indices.
 * @param worker_count Number of processes.
 * @param worker_rank Rank of the process.
 * @param begin First index of the block (output).
 * @param end One past the last index of the block (output).
 * @return void.
 */
void blockLimits(const uint64_t total, const int worker_count, const int worker_rank, uint64_t& begin, uint64_t& end){

    if(worker_count <= 0 || worker_rank < 0 || worker_rank >= worker_count){
        throw std::invalid_argument("ERROR blockLimits: invalid rank " + std::to_string(worker_rank) + " for " + std::to_string(worker_count) + " workers");
    }
    uint64_t elems_per_proc = total / worker_count;
    uint64_t remainder = total % worker_count;
    uint64_t p1 = std::min(remainder, static_cast<uint64_t>(worker_rank));
    uint64_t p2 = std::min(remainder, static_cast<uint64_t>(worker_rank) + 1);
    begin = worker_rank*elems_per_proc + p1;
    end   = (worker_rank + 1)*elems_per_proc + p2;

}

Distribution parseDistribution(const std::string& name){

    if(name == "roundrobin"){
        return Distribution::RoundRobin;
    }
    else if(name == "block"){
        return Distribution::Block;
    }
    throw std::invalid_argument("ERROR parseDistribution: unknown distribution '" + name + "', expected roundrobin or block");

}

WorkDistributor::WorkDistributor(const Distribution distribution, const int procMPI_rank, const int procMPI_size) 
    : distribution_{distribution}, procMPI_rank_{procMPI_rank}, procMPI_size_{procMPI_size} {

    if(procMPI_size <= 0 || procMPI_rank < 0 || procMPI_rank >= procMPI_size){
        throw std::invalid_argument("ERROR WorkDistributor: invalid rank " + std::to_string(procMPI_rank) + " for " + std::to_string(procMPI_size) + " processes");
    }

}

WorkDistributor::WorkDistributor(const WorkDistributor& other) : WorkDistributor(other.distribution_, other.procMPI_rank_, other.procMPI_size_) {}

bool WorkDistributor::owns(const uint64_t index, const uint64_t total) const{

    if(index >= total){
        return false;
    }
    switch(distribution_)
    {
    case Distribution::RoundRobin: {
        return owner(index, procMPI_size_) == procMPI_rank_;
    }
    case Distribution::Block: {
        uint64_t begin, end;
        blockLimits(total, procMPI_size_, procMPI_rank_, begin, end);
        return (index >= begin) && (index < end);
    }
    default:
        throw std::logic_error("ERROR WorkDistributor::owns: unknown distribution");
    }

}

uint64_t WorkDistributor::ownedCount(const uint64_t total) const{

    if(distribution_ == Distribution::Block){
        uint64_t begin, end;
        blockLimits(total, procMPI_size_, procMPI_rank_, begin, end);
        return end - begin;
    }
    uint64_t count = total / procMPI_size_;
    if(static_cast<uint64_t>(procMPI_rank_) < total % procMPI_size_){
        count++;
    }
    return count;

}

}
