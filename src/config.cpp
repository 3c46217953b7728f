#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>
#include <set>

void validate_config(const CacheConfig& cfg) {
    if (cfg.size_bytes == 0 || cfg.block_bytes == 0 || cfg.assoc == 0)
        throw ConfigError(cfg.name + ": size/block/assoc must be > 0");

    if (!is_pow2(cfg.block_bytes))
        throw ConfigError(cfg.name + ": block_bytes must be power-of-two");

    if (cfg.size_bytes % cfg.block_bytes != 0)
        throw ConfigError(cfg.name + ": size_bytes must be multiple of block_bytes");

    if (cfg.num_lines() % cfg.assoc != 0)
        throw ConfigError(cfg.name + ": num_lines must be divisible by assoc");
}

void validate_hierarchy(const std::vector<CacheConfig>& levels) {
    if (levels.empty() || levels.size() > 2)
        throw ConfigError("expected 1 or 2 cache levels, got " + std::to_string(levels.size()));

    std::set<std::string> names;
    for (const auto& cfg : levels) {
        validate_config(cfg);
        if (cfg.name == "MEM")
            throw ConfigError(cfg.name + ": name is reserved for the backing store");
        if (!names.insert(cfg.name).second)
            throw ConfigError(cfg.name + ": duplicate level name");
    }

    // inclusion is tracked per block, so both levels must agree on what a block is
    if (levels.size() == 2 && levels[0].block_bytes != levels[1].block_bytes)
        throw ConfigError(levels[1].name + ": block_bytes must match " + levels[0].name);
}

ReplacementPolicy parse_policy(const std::string& token) {
    std::string t = to_upper(token);
    if (t == "FIFO") return ReplacementPolicy::FIFO;
    if (t == "LRU") return ReplacementPolicy::LRU;
    if (t == "MRU") return ReplacementPolicy::MRU;
    throw ConfigError("unsupported eviction policy: " + token);
}

WritePolicy parse_write_policy(const std::string& token) {
    if (to_upper(token) == "WB") return WritePolicy::WriteBack;
    throw ConfigError("unsupported write policy: " + token + " (only WB)");
}

const char* policy_name(ReplacementPolicy p) {
    switch (p) {
        case ReplacementPolicy::FIFO: return "FIFO";
        case ReplacementPolicy::LRU:  return "LRU";
        case ReplacementPolicy::MRU:  return "MRU";
    }
    return "?";
}

static std::size_t parse_size(const std::string& tok, const std::string& what) {
    uint64_t v = 0;
    if (!parse_uint(tok, v, /*allow_hex=*/false))
        throw ConfigError("bad " + what + ": '" + tok + "'");
    return static_cast<std::size_t>(v);
}

CacheConfig ConfigReader::parse_line(const std::string& line, const std::string& default_name) {
    std::istringstream iss(line);
    std::string size_s, block_s, assoc_s, repl_s, wp_s;
    if (!(iss >> size_s >> block_s >> assoc_s >> repl_s >> wp_s))
        throw ConfigError("expected '<size> <block> <assoc> <policy> <WB> [name]': " + line);

    CacheConfig cfg;
    std::string name;
    cfg.name = (iss >> name) ? name : default_name;

    std::string extra;
    if (iss >> extra) throw ConfigError("unexpected token '" + extra + "' in: " + line);

    cfg.size_bytes = parse_size(size_s, "size");
    cfg.block_bytes = parse_size(block_s, "block size");
    cfg.assoc = parse_size(assoc_s, "associativity");
    cfg.repl = parse_policy(repl_s);
    cfg.wp = parse_write_policy(wp_s);

    validate_config(cfg);
    return cfg;
}

std::vector<CacheConfig> ConfigReader::read(std::istream& in) {
    std::vector<CacheConfig> levels;
    std::string line;
    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        if (line[first] == '#') continue;

        levels.push_back(parse_line(line, "L" + std::to_string(levels.size() + 1)));
    }
    validate_hierarchy(levels);
    return levels;
}

std::vector<CacheConfig> ConfigReader::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Failed to open config file: " + path);
    return read(in);
}
