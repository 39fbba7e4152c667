#include "mme/Reducer.hpp"

namespace mme {

/**
 * Element-wise sum of two partial matrices.
 * @param a First partial matrix.
 * @param b Second partial matrix, with the same shape as a.
 * @return arma::mat a + b.
 */
arma::mat MatrixReducer::combine(const arma::mat& a, const arma::mat& b) const{

    if(a.n_rows != b.n_rows || a.n_cols != b.n_cols){
        throw std::logic_error("ERROR MatrixReducer::combine: partial matrices of shapes (" + std::to_string(a.n_rows) + "," + std::to_string(a.n_cols) + 
            ") and (" + std::to_string(b.n_rows) + "," + std::to_string(b.n_cols) + ") cannot be combined");
    }
    return a + b;

}

PassCounters CountersReducer::combine(const PassCounters& a, const PassCounters& b) const{

    PassCounters result = a;
    result += b;
    return result;

}

}
