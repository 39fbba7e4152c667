#include "mme/IntegralsMME2C.hpp"

namespace mme {

/**
 * Constructor.
 * @param params Calibrated parameters, valid for the basis collections of the subsequent passes.
 * @param comm Process group. It must outlive this object.
 * @param distribution Rule to split the pairs of the full pass among the processes.
 */
IntegralsMME2C::IntegralsMME2C(const IntegralParameters& params, const Communicator& comm, const Distribution distribution) 
    : kernel_{params}, comm_(comm), distributor_{distribution, comm.procRank(), comm.procSize()} {}

/**
 * Copy constructor. The copy shares the process group of other, and the read-only references are rebound to its own attributes.
 * @param other Integrals object to be copied.
 */
IntegralsMME2C::IntegralsMME2C(const IntegralsMME2C& other) 
    : kernel_{other.kernel_}, comm_(other.comm_), distributor_{other.distributor_}, counters_(other.counters_) {}

/**
 * Reset the counters before a pass.
 * @return void.
 */
void IntegralsMME2C::prepare(){

    counters_ = PassCounters();

}

/**
 * Reduce the counters of the pass over all processes and print the G/R split if requested.
 * @param local_counters Counters of the current process.
 * @return void.
 */
void IntegralsMME2C::finalize(const PassCounters& local_counters){

    PassCounters global_counters = local_counters;
    comm_.sumInPlace(global_counters);
    counters_ = global_counters;
    if(kernel_.params.settings.info && comm_.procRank() == 0){
        Diagnostics(counters_).report(std::cout);
    }

}

/**
 * Method to compute the integrals between all the spherical functions of type basis_type_a (rows) and basis_type_b (columns). 
 * The pairs of shell sets are numbered row-major over (atom_a, set_a, atom_b, set_b), and each process only computes the pairs 
 * assigned to it. Each atom position is wrapped into the cell before taking the separation ra - rb, which is not wrapped again.
 * The Cartesian integrals of a pair of sets are contracted with the sphi matrices of both sets.
 * @param kinds List of atomic kinds.
 * @param atoms List of atoms.
 * @param hab Output matrix, resized to (nsgf_a, nsgf_b). Complete in every process on return.
 * @param basis_type_a Basis type of the rows.
 * @param basis_type_b Basis type of the columns.
 * @return void.
 */
void IntegralsMME2C::integrate(const std::vector<Kind>& kinds, const std::vector<Atom>& atoms, arma::mat& hab, 
                               const std::string& basis_type_a, const std::string& basis_type_b){

#pragma omp declare reduction (sumCounters : PassCounters : omp_out += omp_in) initializer(omp_priv = PassCounters())

prepare();
const Lattice& lattice = kernel_.params.lattice;
const int l_max = kernel_.params.l_max;

// Lists of (atom, set) pairs and offsets of the first spherical function of each atom
std::vector<std::array<uint32_t,2>> setlist_a, setlist_b;
std::vector<uint64_t> first_sgf_a(atoms.size()), first_sgf_b(atoms.size());
uint64_t nsgf_a = 0;
uint64_t nsgf_b = 0;
for(uint32_t iatom = 0; iatom < atoms.size(); iatom++){
    if(atoms[iatom].kind >= kinds.size()){
        throw std::invalid_argument("ERROR IntegralsMME2C::integrate: atom " + std::to_string(iatom) + " refers to an undefined kind");
    }
    const Kind& kind = kinds[atoms[iatom].kind];
    const BasisSet& basis_a = kind.basis(basis_type_a);
    const BasisSet& basis_b = kind.basis(basis_type_b);
    first_sgf_a[iatom] = nsgf_a;
    first_sgf_b[iatom] = nsgf_b;
    nsgf_a += basis_a.nsgf;
    nsgf_b += basis_b.nsgf;
    for(uint32_t iset = 0; iset < basis_a.sets.size(); iset++){
        if(basis_a.sets[iset].lmax > l_max){
            throw std::invalid_argument("ERROR IntegralsMME2C::integrate: kind " + kind.label + " has l = " + std::to_string(basis_a.sets[iset].lmax) + 
                " above the calibrated l_max = " + std::to_string(l_max));
        }
        setlist_a.push_back({iatom, iset});
    }
    for(uint32_t jset = 0; jset < basis_b.sets.size(); jset++){
        if(basis_b.sets[jset].lmax > l_max){
            throw std::invalid_argument("ERROR IntegralsMME2C::integrate: kind " + kind.label + " has l = " + std::to_string(basis_b.sets[jset].lmax) + 
                " above the calibrated l_max = " + std::to_string(l_max));
        }
        setlist_b.push_back({iatom, jset});
    }
}
hab.zeros(nsgf_a, nsgf_b);

uint64_t nsets_b = setlist_b.size();
uint64_t total_pairs = setlist_a.size()*nsets_b;
bool print_info = kernel_.params.settings.info && (comm_.procRank() == 0);
if(print_info){
    std::cout << "Computing " << nsgf_a << "x" << nsgf_b << " 2-center MME integrals (" << total_pairs << " pairs of sets)..." << std::flush;
}

// Start the calculation
auto begin = std::chrono::high_resolution_clock::now();  

    PassCounters local_counters;
    std::exception_ptr error_ptr = nullptr;
    #pragma omp parallel for schedule(dynamic) reduction(sumCounters: local_counters)
    for(uint64_t setpair = 0; setpair < total_pairs; setpair++){
        if(!distributor_.owns(setpair, total_pairs)){
            continue;
        }
        try{
            uint32_t iatom = setlist_a[setpair / nsets_b][0];
            uint32_t iset  = setlist_a[setpair / nsets_b][1];
            uint32_t jatom = setlist_b[setpair % nsets_b][0];
            uint32_t jset  = setlist_b[setpair % nsets_b][1];
            const ShellSet& set_a = kinds[atoms[iatom].kind].basis(basis_type_a).sets[iset];
            const ShellSet& set_b = kinds[atoms[jatom].kind].basis(basis_type_b).sets[jset];

            arma::colvec ra = lattice.wrapIntoCell(atoms[iatom].position);
            arma::colvec rb = lattice.wrapIntoCell(atoms[jatom].position);
            arma::colvec rab = ra - rb;

            int ncart_a = set_a.ncartRange();
            int ncart_b = set_b.ncartRange();
            arma::mat hab_cart(set_a.npgf*ncart_a, set_b.npgf*ncart_b, arma::fill::zeros);
            for(int ipgf = 0; ipgf < set_a.npgf; ipgf++){
                for(int jpgf = 0; jpgf < set_b.npgf; jpgf++){
                    kernel_.integrate(set_a.lmin, set_a.lmax, set_b.lmin, set_b.lmax, set_a.zet(ipgf), set_b.zet(jpgf), rab, 
                                      hab_cart, ipgf*ncart_a, jpgf*ncart_b, local_counters);
                }
            }
            uint64_t row = first_sgf_a[iatom] + set_a.first_sgf;
            uint64_t col = first_sgf_b[jatom] + set_b.first_sgf;
            hab.submat(row, col, row + set_a.nsgf - 1, col + set_b.nsgf - 1) += set_a.sphi.t()*hab_cart*set_b.sphi;
        }
        catch(const std::exception&){
            #pragma omp critical (mme_integrate_error)
            {
                if(!error_ptr){
                    error_ptr = std::current_exception();
                }
            }
        }
    }
    if(error_ptr){
        std::rethrow_exception(error_ptr);
    }

    comm_.sumInPlace(hab);
    auto end = std::chrono::high_resolution_clock::now(); 
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - begin); 

if(print_info){
    std::cout << "Done! Elapsed wall-clock time: " << std::to_string( elapsed.count() * 1e-3 ) << " seconds." << std::endl;
}
finalize(local_counters);

}

/**
 * Method to compute the integrals between unnormalized s-type primitives, bypassing the basis sets. The primitive pairs are 
 * numbered row-major over (ipgf, jpgf), and the separation is ra(:,ipgf) - rb(:,jpgf) without wrapping.
 * @param zeta Exponents of the rows.
 * @param zetb Exponents of the columns.
 * @param ra Positions of the row primitives, by columns: (3, n_zeta).
 * @param rb Positions of the column primitives, by columns: (3, n_zetb).
 * @param hab Output matrix, resized to (n_zeta, n_zetb). Complete in every process on return.
 * @return void.
 */
void IntegralsMME2C::integrate_s(const arma::colvec& zeta, const arma::colvec& zetb, const arma::mat& ra, const arma::mat& rb, arma::mat& hab){

#pragma omp declare reduction (sumCounters : PassCounters : omp_out += omp_in) initializer(omp_priv = PassCounters())

    if(ra.n_rows != 3 || ra.n_cols != zeta.n_elem || rb.n_rows != 3 || rb.n_cols != zetb.n_elem){
        throw std::invalid_argument("ERROR IntegralsMME2C::integrate_s: the positions must be (3,n) matrices matching the exponents");
    }
    prepare();
    hab.zeros(zeta.n_elem, zetb.n_elem);

    uint64_t npgfb = zetb.n_elem;
    uint64_t npgf_prod = zeta.n_elem*npgfb;
    PassCounters local_counters;
    std::exception_ptr error_ptr = nullptr;
    #pragma omp parallel for schedule(static,1) reduction(sumCounters: local_counters)
    for(uint64_t ipgf_prod = 0; ipgf_prod < npgf_prod; ipgf_prod++){
        if(!distributor_.owns(ipgf_prod, npgf_prod)){
            continue;
        }
        try{
            uint64_t ipgf = ipgf_prod / npgfb;
            uint64_t jpgf = ipgf_prod % npgfb;
            arma::colvec rab = ra.col(ipgf) - rb.col(jpgf);
            kernel_.integrate(0, 0, 0, 0, zeta(ipgf), zetb(jpgf), rab, hab, ipgf, jpgf, local_counters);
        }
        catch(const std::exception&){
            #pragma omp critical (mme_integrate_error)
            {
                if(!error_ptr){
                    error_ptr = std::current_exception();
                }
            }
        }
    }
    if(error_ptr){
        std::rethrow_exception(error_ptr);
    }

    comm_.sumInPlace(hab);
    finalize(local_counters);

}

/**
 * Store the entries of the integral matrix whose absolute value is above 10^-tol, one per line as value, row, column. 
 * Only rank 0 writes the file.
 * @param hab Integral matrix.
 * @param tol Threshold tolerance: only entries > 10^-tol are stored.
 * @param filename Name of the output file.
 * @return void.
 */
void IntegralsMME2C::saveIntegrals(const arma::mat& hab, const int tol, const std::string& filename) const{

    if(comm_.procRank() != 0){
        return;
    }
    double etol = std::pow(10.,-tol);
    arma::uvec entries = arma::find(arma::abs(hab) > etol);
    uint64_t n_entries = entries.n_elem;

    std::ofstream output_file(filename, std::ios::trunc);
    if(!output_file.is_open()){
        throw std::invalid_argument("ERROR IntegralsMME2C::saveIntegrals: unable to open the file " + filename);
    }
    output_file << "2-CENTER MME COULOMB INTEGRALS" << std::endl;
    output_file << "Tolerance: 10^-" << tol << ". Matrix density: " << ((hab.n_elem > 0)? ((double)n_entries/hab.n_elem)*100 : 0.) << " %" << std::endl;
    output_file << "Entry, mu, mu'" << std::endl;
    output_file << n_entries << std::endl;
    output_file << hab.n_rows << " " << hab.n_cols << std::endl;
    output_file.precision(12);
    output_file << std::scientific;
    for(uint64_t ent = 0; ent < n_entries; ent++){
        arma::uword row = entries(ent) % hab.n_rows;
        arma::uword col = entries(ent) / hab.n_rows;
        output_file << hab(row, col) << "  " << row << " " << col << std::endl;
    }
    output_file.close();

}

}
