#include "endpoint_loader.h"
#include <fstream>

EndpointLoader::EndpointLoader(const std::string& filename)
    : filename_(filename)
{}

std::string EndpointLoader::trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> EndpointLoader::read(std::istream& in) {
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(trim(line));
    }
    return out;
}

bool EndpointLoader::load() {
    std::ifstream infile(filename_);
    if (!infile.is_open()) {
        return false;
    }
    endpoints_ = read(infile);
    return true;
}
