#include "config.hpp"
#include "report.hpp"
#include "simulator.hpp"
#include "trace.hpp"
#include <iostream>
#include <string>
#include <stdexcept>

static void usage(const char* p) {
    std::cerr
      << "Inclusive Two-Level Cache Simulator\n\n"
      << "Usage:\n"
      << "  " << p << " <config.cfg> -t <trace.txt> [--no-log] [--no-summary]\n\n"
      << "Config file, one level per line (L1 first, at most 2 levels):\n"
      << "  <size> <block> <assoc> <FIFO|LRU|MRU> <WB> [name]\n\n"
      << "Trace file, one access per line:\n"
      << "  <R|W> <address>      (decimal or 0x-prefixed hex)\n\n"
      << "Example:\n"
      << "  " << p << " configs/two_level.cfg -t traces/sample.txt\n";
}

static bool isflag(const std::string& a, const std::string& f) { return a == f; }

int main(int argc, char** argv) {
    try {
        if (argc == 1) { usage(argv[0]); return 1; }

        std::string config_path, trace_path;
        bool show_log = true, show_summary = true;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto need = [&](const std::string& f)->std::string{
                if (i+1 >= argc) throw std::invalid_argument("Missing value for " + f);
                return std::string(argv[++i]);
            };

            if (isflag(a,"-t") || isflag(a,"--trace")) trace_path = need(a);
            else if (isflag(a,"--no-log")) show_log = false;
            else if (isflag(a,"--no-summary")) show_summary = false;
            else if (isflag(a,"--help") || isflag(a,"-h")) { usage(argv[0]); return 0; }
            else if (!a.empty() && a[0] == '-') throw std::invalid_argument("Unknown arg: " + a);
            else if (config_path.empty()) config_path = a;
            else throw std::invalid_argument("Unexpected argument: " + a);
        }

        if (config_path.empty()) throw std::invalid_argument("Missing <config.cfg>");
        if (trace_path.empty()) throw std::invalid_argument("Missing -t <trace.txt>");

        // both inputs are fully validated before the first access is simulated
        auto levels = ConfigReader::read_file(config_path);
        auto ops = TraceReader::read_file(trace_path);

        Simulator sim(levels);
        for (const auto& t : ops) {
            auto events = sim.step(t);
            if (show_log) print_log(std::cout, events);
        }

        if (show_summary) {
            if (show_log) std::cout << "\n";
            print_summary(std::cout, sim);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        usage(argv[0]);
        return 1;
    }
}
