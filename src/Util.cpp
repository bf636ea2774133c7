#include "stringly/Util.hpp"
#include "stringly/Errors.hpp"
#include "stringly/Parse.hpp"
#include <algorithm>
#include <cctype>
#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace stringly {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j - i);
}

Overrides parse_overrides(const std::string& s) {
    Overrides out;
    if (trim(s).empty()) return out;
    // split on commas that are not inside a double-quoted value
    bool in_str = false;
    std::string buf;
    auto flush = [&](){
        std::string pair = buf;
        buf.clear();
        if (trim(pair).empty()) return;
        auto pos = pair.find(':');
        if (pos == std::string::npos) {
            throw ParseError(pair, "override entry must have the form key:value");
        }
        std::string k = trim(pair.substr(0, pos));
        std::string v = trim(pair.substr(pos+1));
        if (k.empty()) {
            throw ParseError(pair, "override entry has an empty key");
        }
        out.emplace_back(k, parse_value(v));
    };
    for (size_t i=0;i<s.size();++i){
        char c = s[i];
        if (in_str) {
            buf += c;
            if (c == '"' && s[i-1] != '\\') in_str = false;
            continue;
        }
        if (c=='"') { in_str = true; buf += c; continue; }
        if (c==',') { flush(); continue; }
        buf += c;
    }
    if (in_str) {
        throw ParseError(s, "unterminated quoted value");
    }
    flush();
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += std::strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

} // namespace stringly
