#include "mme/ConfigurationMME.hpp"

namespace mme {

/**
 * File constructor for ConfigurationMME. It extracts the relevant information from the configuration file.
 * @param config_file Name of the configuration file.
 */
ConfigurationMME::ConfigurationMME(const std::string& config_file) : ConfigurationBase(config_file){

    parseContent();
    m_file.close();
    checkContentCoherence();

}

/**
 * Method to parse the configuration from its file.
 * @details The basis block is parsed first, so that the atoms can refer to the kinds by label regardless of the order of the blocks.
 * @return void.
 */
void ConfigurationMME::parseContent(){

    extractArguments();
    extractRawContent();

    if(contents.empty()){
        throw std::logic_error("File contents must be extracted first");
    }

    if(contents.count("basis")){
        parseBasis(contents["basis"]);
    }

    for(const auto& arg : foundArguments){
        auto content = contents[arg];

        if(content.size() == 0){
            continue;
        }

        if(arg == "cell"){
            if(content.size() != 3){
                throw std::invalid_argument("The cell block must contain three lattice vectors");
            }
            cell_.set_size(3,3);
            for(int i = 0; i < 3; i++){
                std::vector<double> Ri = parseLine<double>(content[i]);
                if(Ri.size() != 3){
                    throw std::invalid_argument("Each lattice vector must have three components");
                }
                cell_.row(i) = arma::rowvec(Ri);
            }
        }
        else if(arg == "atoms"){
            for(const auto& line : content){
                std::vector<std::string> words = splitLine(line);
                if(words.size() != 4){
                    throw std::invalid_argument("Expected 'kind x y z' in atoms block, found '" + line + "'");
                }
                uint32_t kind = findKind(words[0]);
                if(kind == kinds_.size()){
                    throw std::invalid_argument("Atom of undefined kind " + words[0]);
                }
                std::vector<double> position = parseLine<double>(words[1] + " " + words[2] + " " + words[3]);
                atoms_.push_back(Atom{kind, arma::colvec(position)});
            }
        }
        else if(arg == "basis"){
        }
        else if(arg == "basis_type"){
            runInfo.basis_type = splitLine(content[0])[0];
        }
        else if(arg == "eps_cutoff"){
            runInfo.settings.eps_cutoff = parseScalar<double>(content[0]);
        }
        else if(arg == "eps_minimax"){
            runInfo.settings.eps_minimax = parseScalar<double>(content[0]);
        }
        else if(arg == "max_terms"){
            int64_t max_terms = parseScalar<int64_t>(content[0]);
            if(max_terms <= 0){
                throw std::invalid_argument("max_terms must be a positive integer.");
            }
            runInfo.settings.max_terms = static_cast<uint64_t>(max_terms);
        }
        else if(arg == "distribution"){
            runInfo.distribution = parseDistribution(parseWord(content[0]));
        }
        else if(arg == "info"){
            std::string str = parseWord(content[0]);
            if((str != "true") && (str != "false")){
                throw std::invalid_argument("Info option must be set to 'true' or 'false'.");
            }
            runInfo.settings.info = (str == "true");
        }
        else if(arg == "output"){
            runInfo.output = splitLine(content[0])[0];
        }
        else if(arg == "tolerance"){
            runInfo.tolerance = parseScalar<int>(content[0]);
        }
        else{    
            std::cout << "Unexpected argument: " << arg << ", skipping block..." << std::endl;
        }
    }

}

/**
 * Method to parse the kind definitions. Each kind starts with 'kind <label> [basis_type]', followed by its sets. Each set starts with 
 * 'set <lmin> <lmax> <npgf>', followed by a 'shells' line with the angular momentum of each contracted shell, and npgf lines 
 * 'zeta c_1 ... c_nshell'.
 * @param content Lines of the basis block.
 * @return void.
 */
void ConfigurationMME::parseBasis(const std::vector<std::string>& content){

    uint32_t iline = 0;
    while(iline < content.size()){
        std::vector<std::string> words = splitLine(content[iline]);
        if(parseWord(content[iline]) != "kind" || words.size() < 2 || words.size() > 3){
            throw std::invalid_argument("Expected 'kind <label> [basis_type]' in basis block, found '" + content[iline] + "'");
        }
        std::string label = words[1];
        BasisSet basis((words.size() == 3)? words[2] : "");
        iline++;

        while(iline < content.size() && parseWord(content[iline]) == "set"){
            std::vector<std::string> set_words = splitLine(content[iline]);
            if(set_words.size() != 4){
                throw std::invalid_argument("Expected 'set <lmin> <lmax> <npgf>', found '" + content[iline] + "'");
            }
            std::vector<int> set_info = parseLine<int>(set_words[1] + " " + set_words[2] + " " + set_words[3]);
            int lmin = set_info[0];
            int lmax = set_info[1];
            int npgf = set_info[2];
            if(npgf <= 0){
                throw std::invalid_argument("A set of kind " + label + " has no primitives");
            }
            iline++;
            if(iline >= content.size()){
                throw std::invalid_argument("Missing shells line in a set of kind " + label);
            }

            std::vector<std::string> shell_words = splitLine(content[iline]);
            if(shell_words.empty() || parseWord(content[iline]) != "shells"){
                throw std::invalid_argument("Expected 'shells l_1 ... l_n' after the set line of kind " + label);
            }
            std::vector<int> shell_l;
            for(uint32_t w = 1; w < shell_words.size(); w++){
                shell_l.push_back(parseScalar<int>(shell_words[w]));
            }
            if(shell_l.empty()){
                throw std::invalid_argument("Set without shells in kind " + label);
            }
            int lmin_shells = *std::min_element(shell_l.begin(), shell_l.end());
            int lmax_shells = *std::max_element(shell_l.begin(), shell_l.end());
            if(lmin_shells != lmin || lmax_shells != lmax){
                throw std::invalid_argument("The shells of a set of kind " + label + " are not compatible with lmin = " + 
                    std::to_string(lmin) + ", lmax = " + std::to_string(lmax));
            }
            iline++;

            if(iline + npgf > content.size()){
                throw std::invalid_argument("Missing exponent lines in a set of kind " + label);
            }
            arma::colvec zet(npgf);
            arma::mat coefs(npgf, shell_l.size());
            for(int ipgf = 0; ipgf < npgf; ipgf++, iline++){
                std::vector<double> values = parseLine<double>(content[iline]);
                if(values.size() != shell_l.size() + 1){
                    throw std::invalid_argument("Expected 'zeta c_1 ... c_" + std::to_string(shell_l.size()) + "', found '" + content[iline] + "'");
                }
                zet(ipgf) = values[0];
                for(uint32_t ishell = 0; ishell < shell_l.size(); ishell++){
                    coefs(ipgf, ishell) = values[ishell + 1];
                }
            }
            basis.addSet(ShellSet::fromShells(zet, coefs, shell_l));
        }

        if(basis.empty()){
            throw std::invalid_argument("Kind " + label + " has no shell sets");
        }
        uint32_t kind = findKind(label);
        if(kind == kinds_.size()){
            kinds_.push_back(Kind(label));
        }
        kinds_[kind].addBasisSet(basis);
    }

}

uint32_t ConfigurationMME::findKind(const std::string& label) const{

    for(uint32_t ikind = 0; ikind < kinds_.size(); ikind++){
        if(kinds_[ikind].label == label){
            return ikind;
        }
    }
    return kinds_.size();

}

/**
 * Method to check the coherence of the parsed configuration.
 * @return void.
 */
void ConfigurationMME::checkContentCoherence(){

    if(cell_.n_elem != 9){
        throw std::invalid_argument("The cell block is missing");
    }
    if(std::abs(arma::det(cell_)) < 1e-10){
        throw std::invalid_argument("The lattice vectors of the cell are linearly dependent");
    }
    if(atoms_.empty()){
        throw std::invalid_argument("At least one atom is required");
    }
    if(kinds_.empty()){
        throw std::invalid_argument("The basis block is missing");
    }
    for(const Atom& atom : atoms_){
        if(!kinds_[atom.kind].hasBasis(runInfo.basis_type)){
            throw std::invalid_argument("Kind " + kinds_[atom.kind].label + " has no basis of type " + runInfo.basis_type);
        }
    }
    if(!(runInfo.settings.eps_cutoff > 0) || !(runInfo.settings.eps_minimax > 0) || !(runInfo.settings.eps_minimax < 1)){
        throw std::invalid_argument("The target errors must be positive, and eps_minimax below 1");
    }
    if(runInfo.settings.max_terms == 0){
        throw std::invalid_argument("max_terms must be positive");
    }

}

}
