#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "simulator.hpp"

// "L1: read miss at address 0x40 (evicted 0x80, writeback)"
std::string format_event(const EventRecord& ev);

void print_log(std::ostream& os, const std::vector<EventRecord>& events);

// Per-level counters, then backing-store traffic.
void print_summary(std::ostream& os, const Simulator& sim);
