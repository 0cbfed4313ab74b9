#pragma once

#include <string>
#include <vector>

namespace prizevote {

using std::string;
using std::vector;

/// "vote:alice" -> {"vote", "alice"}; empty fields are kept
inline vector<string> string_split(const string& str, char delimiter) {
    vector<string> r;
    if (str.empty()) return r;

    size_t from = 0;
    while (true) {
        size_t ind = str.find(delimiter, from);
        if (ind == string::npos) {
            r.push_back(str.substr(from));
            break;
        }
        r.push_back(str.substr(from, ind - from));
        from = ind + 1;
    }
    return r;
}

/**
 * Accepts exactly "vote:$candidate" where $candidate is 1..12 characters.
 * Account charset is left to eosio::name.
 */
inline bool parse_vote_memo(const string& memo, string& candidate) {
    vector<string> memo_arr = string_split(memo, ':');
    if (memo_arr.size() != 2 || memo_arr[0] != "vote") return false;

    const string& param = memo_arr[1];
    if (param.empty() || param.size() > 12) return false;

    candidate = param;
    return true;
}

}
