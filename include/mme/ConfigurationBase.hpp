#pragma once
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mme {

/**
 * The ConfigurationBase class reads a text file made of blocks. Each block starts with a line '# name' and its content 
 * is made of the following lines up to the next block. Everything after '!' is a comment, and empty lines are skipped.
 * Specializations implement parseContent() to turn the raw content of the blocks into data.
 */
class ConfigurationBase {

    protected:
        std::ifstream m_file;
        // Block names in order of appearance (lower case)
        std::vector<std::string> foundArguments;
        // Raw content lines of each block
        std::map<std::string, std::vector<std::string>> contents;

    protected:
        ConfigurationBase() = default;
    public:
        ConfigurationBase(const std::string& file);
        virtual ~ConfigurationBase() = default;

    protected:
        virtual void parseContent() = 0;
        // Extract the names of the blocks of the file
        void extractArguments();
        // Extract the content lines of each block
        void extractRawContent();

        // Remove comments and leading/trailing whitespace
        static std::string standarizeLine(const std::string& line);
        // First word of the line, in lower case
        static std::string parseWord(const std::string& line);
        // Split the line into whitespace-separated words
        static std::vector<std::string> splitLine(const std::string& line);

        // Parse all the values of a line
        template <typename T>
        static std::vector<T> parseLine(const std::string& line){
            std::istringstream iss(standarizeLine(line));
            std::vector<T> values;
            T value;
            while(iss >> value){
                values.push_back(value);
            }
            if(!iss.eof()){
                throw std::invalid_argument("ConfigurationBase: unable to parse line '" + line + "'");
            }
            return values;
        }

        // Parse a line with a single value
        template <typename T>
        static T parseScalar(const std::string& line){
            std::vector<T> values = parseLine<T>(line);
            if(values.size() != 1){
                throw std::invalid_argument("ConfigurationBase: expected a single value in line '" + line + "'");
            }
            return values[0];
        }

};

}
