#pragma once
#include <cstdint>
class CPU;      // forward-declare (defined in cpu.hpp)
class Memory;   // forward-declare (defined in mem.hpp)

// Service a TRAP with the given vector. R7 has already been linked.
// Uses R0 for arguments/results and the console attached to `mem`.
// Returns true if the vector was recognised; unknown vectors are a no-op.
bool handle_trap(CPU& cpu, Memory& mem, uint8_t vector);
