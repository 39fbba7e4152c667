#include "mme/Lattice.hpp"

namespace mme {

/**
 * Constructor from the matrix of lattice vectors.
 * @param Rbasis Bravais vectors (R1,R2,R3) in bohr, stored by columns.
 */
Lattice::Lattice(const arma::mat& Rbasis){

    if(Rbasis.n_rows != 3 || Rbasis.n_cols != 3){
        throw std::invalid_argument("Lattice: the cell matrix must be 3x3");
    }
    this->Rbasis_ = Rbasis;
    computeUnitCellVolume();
    if(unitCellVolume_ < 1e-10){
        throw std::invalid_argument("Lattice: the lattice vectors are linearly dependent");
    }
    this->Rbasis_inv_ = arma::inv(Rbasis_);
    calculateGbasis();
    calculateGmin();

}

/**
 * Copy constructor. The read-only references are rebound to the attributes of the new object.
 * @param other Lattice to be copied.
 */
Lattice::Lattice(const Lattice& other) : Lattice(other.Rbasis_) {}

/**
 * Map a position into the cell centered at the origin, i.e. r - Rbasis*round(Rbasis^-1*r). 
 * Only the endpoint is wrapped, no minimum image is taken for the difference of two wrapped positions.
 * @param r Cartesian position in bohr.
 * @return arma::colvec Wrapped position in bohr.
 */
arma::colvec Lattice::wrapIntoCell(const arma::colvec& r) const{

    arma::colvec frac = Rbasis_inv_*r;
    return r - Rbasis_*arma::round(frac);

}

/**
 * Method to generate a kronecker-like list of integer combinations, centered at zero. Each row contains the 3 coefficients of a 
 * different point. Matrix dimension: ((2n_1+1)*(2n_2+1)*(2n_3+1), 3).
 * @param ni Half-widths of the box along each lattice direction.
 * @return arma::imat List of cell combinations.
 */
arma::imat Lattice::generateCombinations(const std::vector<int32_t>& ni) const{

    if(ni.size() != 3){
        throw std::invalid_argument("ERROR generateCombinations: three half-widths are required");
    }
    arma::imat combinations(boxCount(ni), 3);
    uint64_t row = 0;
    for(int32_t n1 = -ni[0]; n1 <= ni[0]; n1++){
        for(int32_t n2 = -ni[1]; n2 <= ni[1]; n2++){
            for(int32_t n3 = -ni[2]; n3 <= ni[2]; n3++){
                combinations(row,0) = n1;
                combinations(row,1) = n2;
                combinations(row,2) = n3;
                row++;
            }
        }
    }
    return combinations;

}

/**
 * Half-widths of the box of integer combinations of the Bravais vectors containing the sphere |R| <= radius.
 * The fractional coordinate along Ri of a vector R is G_i.R/(2*pi), so it is bounded by |G_i|*radius/(2*pi).
 * @param radius Radius of the sphere in bohr.
 * @return std::vector<int32_t> Half-widths (n1,n2,n3).
 */
std::vector<int32_t> Lattice::boxDirect(const double radius) const{

    std::vector<int32_t> ni(3);
    for(int d = 0; d < 3; d++){
        ni[d] = static_cast<int32_t>( std::ceil(radius*arma::norm(Gbasis_.col(d))/TWOPI) );
    }
    return ni;

}

/**
 * Half-widths of the box of integer combinations of the reciprocal vectors containing the sphere |G| <= radius.
 * @param radius Radius of the sphere in bohr^-1.
 * @return std::vector<int32_t> Half-widths (m1,m2,m3).
 */
std::vector<int32_t> Lattice::boxReciprocal(const double radius) const{

    std::vector<int32_t> mi(3);
    for(int d = 0; d < 3; d++){
        mi[d] = static_cast<int32_t>( std::ceil(radius*arma::norm(Rbasis_.col(d))/TWOPI) );
    }
    return mi;

}

/**
 * Number of lattice points in the centered box with half-widths ni.
 * @param ni Half-widths of the box.
 * @return uint64_t (2n_1+1)*(2n_2+1)*(2n_3+1).
 */
uint64_t Lattice::boxCount(const std::vector<int32_t>& ni){

    uint64_t count = 1;
    for(auto n : ni){
        count *= static_cast<uint64_t>(2*n + 1);
    }
    return count;

}

/**
 * List of reciprocal vectors with 0 < |G| <= Gcut, including only one of each (G,-G) pair, ordered by ascending norm.
 * The retained vector of each pair is the one whose first non-zero integer coordinate is positive.
 * @param Gcut Cutoff norm in bohr^-1.
 * @return arma::mat (3,nG) matrix with the reciprocal vectors by columns.
 */
arma::mat Lattice::generateGlist_half(const double Gcut) const{

    arma::imat combs = generateCombinations(boxReciprocal(Gcut));
    std::vector<uint64_t> kept;
    kept.reserve(combs.n_rows/2);
    double Gcut2 = Gcut*Gcut;
    for(uint64_t row = 0; row < combs.n_rows; row++){
        int n1 = combs(row,0);
        int n2 = combs(row,1);
        int n3 = combs(row,2);
        bool positive_half = (n1 > 0) || (n1 == 0 && n2 > 0) || (n1 == 0 && n2 == 0 && n3 > 0);
        if(!positive_half){
            continue;
        }
        arma::colvec G = n1*Gbasis_.col(0) + n2*Gbasis_.col(1) + n3*Gbasis_.col(2);
        if(arma::dot(G,G) <= Gcut2){
            kept.push_back(row);
        }
    }

    arma::mat Glist(3, kept.size());
    for(uint64_t i = 0; i < kept.size(); i++){
        uint64_t row = kept[i];
        Glist.col(i) = combs(row,0)*Gbasis_.col(0) + combs(row,1)*Gbasis_.col(1) + combs(row,2)*Gbasis_.col(2);
    }
    if(Glist.n_cols > 1){
        arma::rowvec norms = arma::sqrt( arma::sum(Glist % Glist, 0) );
        arma::uvec indices = arma::stable_sort_index(norms);
        Glist = Glist.cols(indices); // Order the reciprocal vectors according to the norms
    }
    return Glist;

}

/**
 * Method to compute the unit cell volume.
 * @return void
 */
void Lattice::computeUnitCellVolume(){

	this->unitCellVolume_ = std::abs( arma::det( Rbasis_ ) );

}

/**
 * Compute the reciprocal lattice vectors {G_1,G_2,G_3} and store them by columns in arma::mat (3,3), in bohr^-1.
 * @return void.
 */
void Lattice::calculateGbasis(){
    
    arma::colvec R1 = Rbasis_.col(0);
    arma::colvec R2 = Rbasis_.col(1);
    arma::colvec R3 = Rbasis_.col(2);
    double volFac = TWOPI/arma::det(Rbasis_);
    arma::mat Gbasis(3,3);
    Gbasis.col(0) = volFac*arma::cross(R2,R3);
    Gbasis.col(1) = volFac*arma::cross(R3,R1);
    Gbasis.col(2) = volFac*arma::cross(R1,R2);

    this->Gbasis_ = Gbasis;

}

/**
 * Find the norm of the shortest non-zero reciprocal lattice vector, searching the box spanned by the reduced vectors.
 * @return void.
 */
void Lattice::calculateGmin(){

    double Gmin = arma::norm(Gbasis_.col(0));
    for(int d = 1; d < 3; d++){
        Gmin = std::min(Gmin, arma::norm(Gbasis_.col(d)));
    }
    arma::imat combs = generateCombinations(boxReciprocal(Gmin));
    for(uint64_t row = 0; row < combs.n_rows; row++){
        if(combs(row,0) == 0 && combs(row,1) == 0 && combs(row,2) == 0){
            continue;
        }
        arma::colvec G = combs(row,0)*Gbasis_.col(0) + combs(row,1)*Gbasis_.col(1) + combs(row,2)*Gbasis_.col(2);
        Gmin = std::min(Gmin, arma::norm(G));
    }
    this->Gmin_ = Gmin;

}

}
