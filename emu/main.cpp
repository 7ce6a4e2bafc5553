// emu/main.cpp
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstddef>

#include "cpu.hpp"
#include "mem.hpp"
#include "console.hpp"
#include "image.hpp"
#include "trace.hpp"
#include "lifecycle.hpp"
#include "options.hpp"

static void dump_trace(const Options& o){
    if (o.trace_path.empty()) return;
    if (global_trace().write_ndjson(o.trace_path)){
        if (o.verbose)
            std::cerr << "[trace] wrote " << global_trace().size()
                      << " records to '" << o.trace_path << "'\n";
    } else {
        std::cerr << "[trace] cannot write '" << o.trace_path << "'\n";
    }
}

// ------------------ main ------------------
int main(int argc, char** argv){
    Options opt;
    int rc = parse_args(argc, argv, opt, std::cout, std::cerr);
    if (rc >= 0) return rc;

    // 0) memory + console + CPU
    TermConsole con;
    Memory ram(&con);
    CPU    cpu;

    // 1) signals go to the watcher before the terminal is switched, so a
    //    Ctrl-C can never leave it raw. The guard is declared first so it
    //    outlives the watcher thread that may call restore() on it.
    RawModeGuard  raw;
    SignalWatcher watcher;
    watcher.on_cancel([&](int signo){
        cpu.cancel();
        raw.restore();
        std::cerr << "\n[lc3] interrupted (signal " << signo << ")\n";
        std::_Exit(128 + signo);
    });
    raw.engage();

    // 2) images, in order
    for (const auto& path : opt.images){
        try {
            std::size_t n = 0;
            uint16_t origin = load_image(path, ram, &n);
            if (opt.verbose)
                std::cerr << "[image] loaded '" << path << "' origin=0x" << std::hex
                          << origin << std::dec << " words=" << n << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[image] failed to load image: " << path
                      << " (" << e.what() << ")\n";
            return 1;
        }
    }

    if (!opt.trace_path.empty()){
        try {
            global_trace().set_capacity(opt.trace_depth);
        } catch (const std::exception& e) {
            std::cerr << "[trace] cannot reserve " << opt.trace_depth
                      << " records (" << e.what() << ")\n";
            return 1;
        }
        global_trace().enable(true);
    }

    cpu.reset(CPU::PC_START);
    try {
        cpu.run(ram);
    } catch (const CpuFault& f) {
        raw.restore();
        std::cerr << "[lc3] fatal: " << f.what() << "\n";
        dump_trace(opt);
        return 70;
    }

    raw.restore();
    if (opt.verbose)
        std::cerr << "[lc3] halted after " << cpu.instret << " instructions\n";
    dump_trace(opt);
    return 0;
}
