#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <cstdio>

struct TraceRec {
    uint16_t pc;
    uint16_t instr;
    uint8_t  opcode;
    uint64_t instret_after;
};

// Bounded ring of retired instructions; keeps the newest max_keep.
class TraceLog {
public:
    void enable(bool on){ enabled = on; }
    bool is_enabled() const { return enabled; }

    void push(uint16_t pc, uint16_t instr, uint8_t opcode, uint64_t instret_after)
    {
        if(!enabled) return;
        if (records.size() < max_keep) {
            records.push_back(TraceRec{pc,instr,opcode,instret_after});
        } else {
            records[idx % max_keep] = TraceRec{pc,instr,opcode,instret_after};
            idx++;
        }
    }

    // oldest first, one JSON object per line
    bool write_ndjson(const std::string& path) const;

    void set_capacity(size_t n){
        max_keep = n ? n : 1;
        records.clear();
        records.reserve(max_keep);
        idx = 0;
    }

    size_t size() const { return records.size(); }
    size_t capacity() const { return max_keep; }

    // i-th oldest record still held
    const TraceRec& at(size_t i) const {
        if (idx == 0) return records[i];
        return records[(idx + i) % max_keep];
    }

    void clear(){ records.clear(); idx = 0; }

private:
    bool enabled = false;
    size_t max_keep = 4096;
    size_t idx = 0;
    std::vector<TraceRec> records;
};

// global accessor
TraceLog& global_trace();
