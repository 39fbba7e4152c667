#pragma once
#include "mme/IntegralParameters.hpp"
#include <armadillo>
#include <vector>

namespace mme {

/**
 * Interface of the element-wise combination of the partial results of several processes. 
 * The combination must be associative and commutative, and the default-constructed value must be its identity.
 */
template <typename T>
class Reducible {

    public:
        virtual ~Reducible() = default;

        virtual T combine(const T& a, const T& b) const = 0;

        // Combine all the partial results, in order
        T reduce(const std::vector<T>& parts) const {
            if(parts.empty()){
                throw std::invalid_argument("ERROR Reducible::reduce: no partial results to combine");
            }
            T result = parts[0];
            for(size_t i = 1; i < parts.size(); i++){
                result = combine(result, parts[i]);
            }
            return result;
        }

};

// Element-wise sum of matrices of the same shape
class MatrixReducer : public Reducible<arma::mat> {
    public:
        arma::mat combine(const arma::mat& a, const arma::mat& b) const override;
};

// Sum of the G/R counters
class CountersReducer : public Reducible<PassCounters> {
    public:
        PassCounters combine(const PassCounters& a, const PassCounters& b) const override;
};

}
