#include "mme/ExponentStatistics.hpp"

namespace mme {

/**
 * Constructor that scans the basis sets of a given type in two passes. The first pass finds l_m, zet_m and zet_mm independently; 
 * the second finds l_zet among the primitives with exponent zet_m and zet_l among the primitives with angular momentum l_m. 
 * The angular momentum of a primitive is the maximum angular momentum of its shell set.
 * @param kinds List of atomic kinds.
 * @param basis_type Type of the basis sets to scan. If empty, the first basis set of each kind is used.
 */
ExponentStatistics::ExponentStatistics(const std::vector<Kind>& kinds, const std::string& basis_type){

    bool found = false;
    for(const Kind& kind : kinds){
        if(!kind.hasBasis(basis_type)){
            continue;
        }
        for(const ShellSet& set : kind.basis(basis_type).sets){
            for(int ipgf = 0; ipgf < set.npgf; ipgf++){
                double zet = set.zet(ipgf);
                if(!found){
                    zet_mm_ = zet;
                    found = true;
                }
                l_m_    = std::max(l_m_, set.lmax);
                zet_m_  = std::max(zet_m_, zet);
                zet_mm_ = std::min(zet_mm_, zet);
            }
        }
    }

    for(const Kind& kind : kinds){
        if(!kind.hasBasis(basis_type)){
            continue;
        }
        for(const ShellSet& set : kind.basis(basis_type).sets){
            for(int ipgf = 0; ipgf < set.npgf; ipgf++){
                double zet = set.zet(ipgf);
                if(zet == zet_m_){
                    l_zet_ = std::max(l_zet_, set.lmax);
                }
                if(set.lmax == l_m_){
                    zet_l_ = std::max(zet_l_, zet);
                }
            }
        }
    }

    if(!(zet_l_ > 0) || l_zet_ < 0){
        throw std::invalid_argument("ERROR ExponentStatistics: no valid primitive found in the basis collection" + 
            (basis_type.empty()? std::string("") : " of type " + basis_type));
    }

}

ExponentStatistics::ExponentStatistics(const ExponentStatistics& other) 
    : l_m_{other.l_m_}, zet_m_{other.zet_m_}, zet_mm_{other.zet_mm_}, zet_l_{other.zet_l_}, l_zet_{other.l_zet_} {}

}
