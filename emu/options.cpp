#include <iostream>
#include <cctype>
#include "options.hpp"

void usage(std::ostream& os){
    os << "usage: lc3emu [options] image-file1 [image-file2 ...]\n"
          "  -t, --trace <file>     write the last executed instructions as NDJSON\n"
          "      --trace-depth <n>  number of trace records to keep (default 4096, max 1048576)\n"
          "  -v, --verbose          report loaded images and instruction count\n"
          "  -h, --help             show this help\n";
}

bool parse_trace_depth(const std::string& s, std::size_t& out){
    if (s.empty() || s.size() > 8) return false;      // 8 digits is past the cap
    std::size_t v = 0;
    for (char c : s){
        if (!std::isdigit((unsigned char)c)) return false;   // rejects "-1", "+3", " 7"
        v = v * 10 + (std::size_t)(c - '0');
    }
    if (v == 0 || v > Options::MAX_TRACE_DEPTH) return false;
    out = v;
    return true;
}

int parse_args(int argc, const char* const* argv, Options& o,
               std::ostream& out, std::ostream& err){
    for (int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if (a == "-h" || a == "--help"){ usage(out); return 0; }
        else if (a == "-v" || a == "--verbose"){ o.verbose = true; }
        else if (a == "-t" || a == "--trace" || a == "--trace-depth"){
            if (i + 1 >= argc){
                err << "[lc3] " << a << " needs an argument\n";
                return 2;
            }
            std::string v = argv[++i];
            if (a == "--trace-depth"){
                if (!parse_trace_depth(v, o.trace_depth)){
                    err << "[lc3] bad --trace-depth '" << v << "'\n";
                    return 2;
                }
            } else {
                o.trace_path = v;
            }
        }
        else if (a.size() > 1 && a[0] == '-'){
            err << "[lc3] unknown option " << a << "\n";
            usage(err);
            return 2;
        }
        else o.images.push_back(a);
    }
    if (o.images.empty()){ usage(err); return 2; }
    return -1;
}
