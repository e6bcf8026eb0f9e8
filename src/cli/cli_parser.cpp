#include "cli/cli_parser.hpp"

#include <stdexcept>

namespace rkpi2 {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0) continue;

        std::string key = a.substr(2);
        const size_t eq = key.find('=');
        if (eq != std::string::npos) {
            kv_[key.substr(0, eq)] = key.substr(eq + 1);
            continue;
        }
        std::string val = "true";
        if (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                val = next;
                ++i;
            }
        }
        kv_[key] = val;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

long CliParser::get_int(const std::string& key, long lo, long hi) const {
    const std::string s = get(key);
    size_t used = 0;
    long v = 0;
    try {
        v = std::stol(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("--" + key + " must be an integer (got '" + s + "')");
    }
    if (used != s.size()) throw std::runtime_error("--" + key + " must be an integer (got '" + s + "')");
    if (v < lo || v > hi) {
        throw std::runtime_error("--" + key + " must be in " + std::to_string(lo) + ".." + std::to_string(hi));
    }
    return v;
}

} // namespace rkpi2
