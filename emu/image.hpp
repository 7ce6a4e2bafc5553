#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>
#include "mem.hpp"

// Image format: big-endian origin word, then big-endian words placed at
// origin, origin+1, ... until the data runs out (or memory does).

// Decode an image held in memory. Returns the origin; `loaded` (if given)
// receives the number of words written.
uint16_t load_image_bytes(const std::vector<uint8_t>& bytes, Memory& mem,
                          std::size_t* loaded = nullptr);

// Same, reading the image from a file.
uint16_t load_image(const std::string& path, Memory& mem,
                    std::size_t* loaded = nullptr);

// Utility: slurp a whole file into a vector
std::vector<uint8_t> read_file(const std::string& path);
