#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include "cache.hpp"

struct TraceOp {
    AccessType op;  // Read or Write
    uint64_t addr;  // byte address
};

class TraceReader {
public:
    // Lines like: "R 0x1234" or "w 1234". Ignores blanks and lines starting '#'.
    // Any other malformed line throws TraceError; nothing is skipped.
    static std::vector<TraceOp> read_file(const std::string& path);
    static std::vector<TraceOp> read(std::istream& in);

    static TraceOp parse_line(const std::string& line, std::size_t line_no);
};
