#pragma once

#include <string>
#include <unordered_map>

namespace rkpi2 {

// Very small CLI parser:
//   --key value
//   --key=value
//   --flag (treated as "true")
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws std::runtime_error if the value is not an integer in [lo, hi].
    long get_int(const std::string& key, long lo, long hi) const;
private:
    std::unordered_map<std::string, std::string> kv_;
};

} // namespace rkpi2
