#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

enum class ReplacementPolicy { FIFO, LRU, MRU };
enum class WritePolicy { WriteBack };

struct CacheConfig {
    std::string name = "L1";
    std::size_t size_bytes = 64;
    std::size_t block_bytes = 8;
    std::size_t assoc = 2;
    ReplacementPolicy repl = ReplacementPolicy::LRU;
    WritePolicy wp = WritePolicy::WriteBack;

    std::size_t num_lines() const { return size_bytes / block_bytes; }
    std::size_t num_sets() const { return num_lines() / assoc; }
};

// Throws ConfigError when the geometry does not form a whole number of sets.
void validate_config(const CacheConfig& cfg);

// Level list in L1-then-L2 order: 1 or 2 entries, unique names, one block size.
void validate_hierarchy(const std::vector<CacheConfig>& levels);

ReplacementPolicy parse_policy(const std::string& token);
WritePolicy parse_write_policy(const std::string& token);
const char* policy_name(ReplacementPolicy p);

class ConfigReader {
public:
    // One level per line: "<size> <block> <assoc> <FIFO|LRU|MRU> <WB> [name]",
    // e.g. "64 8 2 LRU WB L1". Ignores blanks and lines starting '#'.
    static std::vector<CacheConfig> read_file(const std::string& path);
    static std::vector<CacheConfig> read(std::istream& in);

    static CacheConfig parse_line(const std::string& line, const std::string& default_name);
};
