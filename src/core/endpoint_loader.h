#pragma once
#include <istream>
#include <string>
#include <vector>

// Reads the newline-delimited endpoint list. Each line is trimmed of
// surrounding whitespace; blank lines are kept and probed like any other
// entry (they come back inconclusive).

class EndpointLoader {
public:
    explicit EndpointLoader(const std::string& filename);

    /**
     * @brief Read every line of the file
     * @return true if the file could be opened
     */
    bool load();

    const std::vector<std::string>& endpoints() const { return endpoints_; }

    /// Read endpoints from an already open stream.
    static std::vector<std::string> read(std::istream& in);

    static std::string trim(const std::string& s);

private:
    std::string filename_;
    std::vector<std::string> endpoints_;
};
