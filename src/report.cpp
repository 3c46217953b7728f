#include "report.hpp"
#include "util.hpp"
#include <iomanip>
#include <ostream>

static const char* type_name(EventType t) {
    switch (t) {
        case EventType::Read:       return "read";
        case EventType::Write:      return "write";
        case EventType::Writeback:  return "writeback";
        case EventType::Invalidate: return "invalidate";
    }
    return "?";
}

std::string format_event(const EventRecord& ev) {
    std::string s = ev.level + ": " + type_name(ev.type);

    if (ev.type == EventType::Read || ev.type == EventType::Write)
        s += ev.hit ? " hit" : " miss";

    s += " at address " + hex_addr(ev.addr);

    if (ev.eviction) {
        s += " (evicted " + hex_addr(ev.evicted_addr);
        if (ev.writeback) s += ", writeback";
        s += ")";
    } else if (ev.type == EventType::Invalidate && ev.writeback) {
        s += " (writeback)";
    }
    return s;
}

void print_log(std::ostream& os, const std::vector<EventRecord>& events) {
    for (const auto& ev : events) os << format_event(ev) << "\n";
}

void print_summary(std::ostream& os, const Simulator& sim) {
    const auto& rs = sim.stats();
    const auto& h = sim.hierarchy();

    os << "=== Results ===\n";
    os << "Trace accesses: " << rs.accesses
       << " (reads=" << rs.reads << " writes=" << rs.writes << ")\n\n";

    for (std::size_t i = 0; i < h.depth(); ++i) {
        const auto& c = h.level(i);
        const auto& s = c.stats();
        os << "[" << c.name() << "] " << c.cfg().size_bytes << "B "
           << c.cfg().assoc << "-way " << policy_name(c.cfg().repl) << "\n";
        os << "     hits=" << s.hits() << " misses=" << s.misses()
           << " hit_rate=" << std::fixed << std::setprecision(4) << s.hit_rate()
           << " evictions=" << s.evictions << " writebacks=" << s.writebacks << "\n";
        os << "     read_hits=" << s.read_hits << " read_misses=" << s.read_misses
           << " write_hits=" << s.write_hits << " write_misses=" << s.write_misses
           << " invalidations=" << s.invalidations << "\n\n";
    }

    const auto& hs = h.hstats();
    os << "[" << kMemoryName << "] reads=" << hs.mem_reads << " writes=" << hs.mem_writes << "\n";
}
