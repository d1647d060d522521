#include <algorithm>
#include <set>

#include <boost/crc.hpp>
#include <boost/foreach.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "naming.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

static const char charset[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

string
seeded_rand_string(size_t length, const string& seed)
{
    boost::crc_32_type crc;
    string s;
    size_t i;

    crc.process_bytes(seed.data(), seed.size());
    boost::random::mt19937 gen(crc.checksum());
    boost::random::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    for (i = 0; i < length; i++) {
        s += charset[dist(gen)];
    }
    return s;
}

string
sanitize_identifier(const string& id)
{
    string s(id);
    string::iterator it;

    for (it = s.begin(); it != s.end(); it++) {
        char c = *it;
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
            || (c >= '0' && c <= '9') || c == '_' || c == '-')
            continue;
        *it = '_';
    }
    return s;
}

string
collapse_separators(const string& name)
{
    string s;
    size_t start, end;

    BOOST_FOREACH(char c, name) {
        if (c == '_' && !s.empty() && s[s.length() - 1] == '_')
            continue;
        s += c;
    }
    start = s.find_first_not_of('_');
    if (start == string::npos)
        return "";
    end = s.find_last_not_of('_');
    return s.substr(start, end - start + 1);
}

string
ipset_name(const string& prefix, const string& family, const string& kind,
           const vector<string>& networks)
{
    set<string> sorted(networks.begin(), networks.end());
    vector<string> unique(sorted.begin(), sorted.end());
    string seed, name;

    seed = family + ":" + kind + ":" + join(unique, ",");
    name = collapse_separators(sanitize_identifier(prefix));
    if (name.length() > (size_t)FWTRUST_MAXPREFIXLEN)
        name = collapse_separators(name.substr(0, FWTRUST_MAXPREFIXLEN));
    if (!name.empty())
        name += "_";
    name += seeded_rand_string(FWTRUST_MAXNAMELEN - name.length(), seed);

    log_msg("ipset_name(%s) = %s", seed.c_str(), name.c_str());
    return name;
}

string
rule_name(int order, const string& id, const string& target)
{
    string name(FWTRUST_RULE_PREFIX);

    name += "_" + my_itoa(order) + "_" + sanitize_identifier(id)
        + "_" + target;
    return collapse_separators(name);
}

string
service_name(const string& prefix, const string& id)
{
    return collapse_separators(sanitize_identifier(prefix) + "_"
                               + sanitize_identifier(id));
}

} // end namespace fwtrust
