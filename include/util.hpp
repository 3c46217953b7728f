#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>
#include <cctype>

// Bad cache geometry or policy token. Raised before any access is simulated.
struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Malformed trace record. The run is aborted, records are never skipped.
struct TraceError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline bool is_pow2(std::size_t x) { return x && ((x & (x - 1)) == 0); }

inline std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Unsigned integer token: decimal, or hex with a 0x prefix when allow_hex is set.
// Signs, blanks and trailing junk are rejected. Returns false instead of throwing so
// callers can raise their own error type.
inline bool parse_uint(const std::string& tok, uint64_t& out, bool allow_hex = true) {
    bool hex = allow_hex && tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X');
    std::size_t start = hex ? 2 : 0;
    if (start == tok.size()) return false;
    const char* digits = hex ? "0123456789abcdefABCDEF" : "0123456789";
    if (tok.find_first_not_of(digits, start) != std::string::npos) return false;
    try {
        out = std::stoull(tok.substr(start), nullptr, hex ? 16 : 10);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

inline std::string hex_addr(uint64_t addr) {
    std::ostringstream os;
    os << "0x" << std::hex << addr;
    return os.str();
}
