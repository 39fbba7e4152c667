#include "mme/ConfigurationBase.hpp"

namespace mme {

/**
 * File constructor. It only opens the file, the content is parsed by the specializations.
 * @param file Name of the configuration file.
 */
ConfigurationBase::ConfigurationBase(const std::string& file){

    if(file.empty()){
        throw std::invalid_argument("ConfigurationBase: file must not be empty");
    }
    m_file.open(file.c_str());
    if(!m_file.is_open()){
        throw std::invalid_argument("ConfigurationBase: file " + file + " does not exist");
    }

}

/**
 * Method to extract the names of the blocks ('# name' lines) of the file, in lower case and in order of appearance.
 * @return void.
 */
void ConfigurationBase::extractArguments(){

    if(!m_file.is_open()){
        throw std::logic_error("ConfigurationBase: the file must be opened before extracting its arguments");
    }
    foundArguments.clear();
    std::string line;
    while(std::getline(m_file, line)){
        line = standarizeLine(line);
        if(!line.empty() && line[0] == '#'){
            std::string arg = standarizeLine(line.substr(1));
            std::transform(arg.begin(), arg.end(), arg.begin(), [](unsigned char c){ return std::tolower(c); });
            if(arg.empty()){
                throw std::invalid_argument("ConfigurationBase: block without name");
            }
            if(std::find(foundArguments.begin(), foundArguments.end(), arg) != foundArguments.end()){
                throw std::invalid_argument("ConfigurationBase: repeated block " + arg);
            }
            foundArguments.push_back(arg);
        }
    }
    m_file.clear();
    m_file.seekg(0, std::ios::beg);

}

/**
 * Method to extract the (non-empty, comment-free) content lines of each block.
 * @return void.
 */
void ConfigurationBase::extractRawContent(){

    if(!m_file.is_open()){
        throw std::logic_error("ConfigurationBase: the file must be opened before extracting its content");
    }
    contents.clear();
    for(const auto& arg : foundArguments){
        contents[arg] = std::vector<std::string>();
    }
    std::string line;
    std::string current_arg;
    while(std::getline(m_file, line)){
        line = standarizeLine(line);
        if(line.empty()){
            continue;
        }
        if(line[0] == '#'){
            current_arg = standarizeLine(line.substr(1));
            std::transform(current_arg.begin(), current_arg.end(), current_arg.begin(), [](unsigned char c){ return std::tolower(c); });
            continue;
        }
        if(current_arg.empty()){
            throw std::invalid_argument("ConfigurationBase: content found outside of any block: '" + line + "'");
        }
        contents[current_arg].push_back(line);
    }
    m_file.clear();
    m_file.seekg(0, std::ios::beg);

}

std::string ConfigurationBase::standarizeLine(const std::string& line){

    std::string str = line.substr(0, line.find('!'));
    size_t first = str.find_first_not_of(" \t\r\n");
    if(first == std::string::npos){
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);

}

std::string ConfigurationBase::parseWord(const std::string& line){

    std::vector<std::string> words = splitLine(line);
    if(words.empty()){
        throw std::invalid_argument("ConfigurationBase: expected a word, found an empty line");
    }
    std::string word = words[0];
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c){ return std::tolower(c); });
    return word;

}

std::vector<std::string> ConfigurationBase::splitLine(const std::string& line){

    std::istringstream iss(standarizeLine(line));
    std::vector<std::string> words;
    std::string word;
    while(iss >> word){
        words.push_back(word);
    }
    return words;

}

}
