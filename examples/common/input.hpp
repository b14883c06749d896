#pragma once

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>


namespace chunkwire::examples {

    // Whole content of 'path' ("-" reads stdin). False when the file cannot be opened.
    [[nodiscard]]
    inline bool read_all(const std::string& path, std::string& out) {
        if (path == "-") {
            out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            return !std::cin.bad();
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return false;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        out = ss.str();
        return !in.bad();
    }

} // namespace chunkwire::examples
