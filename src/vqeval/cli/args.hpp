#pragma once
#include <string>
#include <vector>
#include <stdexcept>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the mode.
      Example:   prog compare --ref=a.mp4 --cand=b.mp4 --samples=50
    - Keys are case-sensitive.

  Notes:
    - If a key is missing, the default value is returned.
    - A present but malformed number is an error (std::invalid_argument),
      so a typo never silently turns into the default.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' when missing. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        std::size_t used = 0;
        const int n = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::logic_error&) {   // invalid_argument, out_of_range
        throw std::invalid_argument("--" + key + ": not an integer: '" + v + "'");
    }
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* Split "a,b;c d" into {"a","b","c","d"}. */
inline std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c: s) {
        if (c==',' || c==';' || c==' ' || c=='\t') {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}
