#include "image.hpp"
#include <fstream>
#include <algorithm>

std::vector<uint8_t> read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) throw std::runtime_error("open failed: "+path);
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf((size_t)std::max<long long>(0,n));
    if(n>0 && !f.read((char*)buf.data(), n))
        throw std::runtime_error("read failed: "+path);
    return buf;
}

static uint16_t u16be(const uint8_t* b){
    return (uint16_t)((b[0] << 8) | b[1]);
}

uint16_t load_image_bytes(const std::vector<uint8_t>& bytes, Memory& mem,
                          std::size_t* loaded){
    if(bytes.size() < 2) throw std::runtime_error("image too short");

    const uint16_t origin = u16be(bytes.data());

    // trailing odd byte is ignored; nothing is written past 0xFFFF
    std::size_t words = (bytes.size() - 2) / 2;
    words = std::min<std::size_t>(words, Memory::WORDS - origin);

    for(std::size_t i=0;i<words;i++){
        mem.write((uint16_t)(origin + i), u16be(bytes.data() + 2 + 2*i));
    }
    if(loaded) *loaded = words;
    return origin;
}

uint16_t load_image(const std::string& path, Memory& mem, std::size_t* loaded){
    return load_image_bytes(read_file(path), mem, loaded);
}
