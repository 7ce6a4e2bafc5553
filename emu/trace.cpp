#include "trace.hpp"
#include "cpu.hpp"

TraceLog& global_trace(){
    static TraceLog log;
    return log;
}

bool TraceLog::write_ndjson(const std::string& path) const {
    FILE* f = std::fopen(path.c_str(), "wb");
    if(!f) return false;
    for(size_t k=0; k<records.size(); k++){
        const TraceRec& r = at(k);
        std::fprintf(f,
          "{\"pc\":%u,\"instr\":%u,\"op\":\"%s\",\"instret\":%llu}\n",
          (unsigned)r.pc, (unsigned)r.instr,
          CPU::op_name(static_cast<CPU::Op>(r.opcode)),
          (unsigned long long)r.instret_after);
    }
    return std::fclose(f) == 0;
}
