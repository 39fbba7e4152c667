#pragma once
#include "mme/IntegralParameters.hpp"
#include <armadillo>

namespace mme {

/**
 * Abstract process group seen by the integration passes: rank and size of the group, and the global element-wise 
 * sum that every process must enter at the end of a pass.
 */
class Communicator {

    public:
        virtual ~Communicator() = default;

        virtual int procRank() const = 0;
        virtual int procSize() const = 0;
        // Replace the local matrix by the element-wise sum over all processes. The shape must be the same in every process
        virtual void sumInPlace(arma::mat& buffer) const = 0;
        // Replace the local counters by their sum over all processes
        virtual void sumInPlace(PassCounters& counters) const = 0;
        virtual void barrier() const = 0;

};

/**
 * One process of a simulated group: it computes the share of the given rank, and its reduction leaves the local result 
 * untouched, so that the partial results can be combined afterwards with a Reducible.
 */
class CommunicatorLocal : public Communicator {

    protected:
        int procRank_;
        int procSize_;

    public:
        CommunicatorLocal(const int procRank = 0, const int procSize = 1);

        int procRank() const override { return procRank_; }
        int procSize() const override { return procSize_; }
        void sumInPlace(arma::mat&) const override {}
        void sumInPlace(PassCounters&) const override {}
        void barrier() const override {}

};

}
