#include "mme/Kind.hpp"

namespace mme {

Kind::Kind(const std::string& label) : label_{label} {}

Kind::Kind(const Kind& other) : label_{other.label_}, basis_sets_{other.basis_sets_} {}

Kind& Kind::operator=(const Kind& other){
    label_ = other.label_;
    basis_sets_ = other.basis_sets_;
    return *this;
}

void Kind::addBasisSet(const BasisSet& basis){
    if(hasBasis(basis.basis_type) && !basis.basis_type.empty()){
        throw std::invalid_argument("ERROR Kind::addBasisSet: kind " + label_ + " already has a basis of type " + basis.basis_type);
    }
    basis_sets_.push_back(basis);
}

bool Kind::hasBasis(const std::string& basis_type) const{
    if(basis_type.empty()){
        return !basis_sets_.empty();
    }
    for(const auto& basis : basis_sets_){
        if(basis.basis_type == basis_type){
            return true;
        }
    }
    return false;
}

/**
 * Basis set of the given type.
 * @param basis_type Type label of the basis set. If empty, the first basis set of the kind is returned.
 * @return const BasisSet& Basis set.
 */
const BasisSet& Kind::basis(const std::string& basis_type) const{

    if(basis_sets_.empty()){
        throw std::invalid_argument("ERROR Kind::basis: kind " + label_ + " has no basis set");
    }
    if(basis_type.empty()){
        return basis_sets_.front();
    }
    for(const auto& basis : basis_sets_){
        if(basis.basis_type == basis_type){
            return basis;
        }
    }
    throw std::invalid_argument("ERROR Kind::basis: kind " + label_ + " has no basis of type " + basis_type);

}

}
