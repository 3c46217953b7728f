#include "trace.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>

static TraceError bad_record(std::size_t line_no, const std::string& why, const std::string& line) {
    return TraceError("trace line " + std::to_string(line_no) + ": " + why + ": '" + line + "'");
}

TraceOp TraceReader::parse_line(const std::string& line, std::size_t line_no) {
    std::istringstream iss(line);
    std::string op_s, addr_s, extra;
    if (!(iss >> op_s >> addr_s)) throw bad_record(line_no, "expected '<op> <address>'", line);
    if (iss >> extra) throw bad_record(line_no, "unexpected token '" + extra + "'", line);

    TraceOp t{};
    if (op_s == "R" || op_s == "r") t.op = AccessType::Read;
    else if (op_s == "W" || op_s == "w") t.op = AccessType::Write;
    else throw bad_record(line_no, "bad operation '" + op_s + "'", line);

    if (!parse_uint(addr_s, t.addr)) throw bad_record(line_no, "bad address '" + addr_s + "'", line);
    return t;
}

std::vector<TraceOp> TraceReader::read(std::istream& in) {
    std::vector<TraceOp> ops;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        if (line[first] == '#') continue;

        ops.push_back(parse_line(line, line_no));
    }
    return ops;
}

std::vector<TraceOp> TraceReader::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw TraceError("Failed to open trace file: " + path);
    return read(in);
}
