#include <cstring>
#include <iostream>
#include <set>

#include <arpa/inet.h>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include "network.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

const char *
family_tag(enum Network::FAMILY family)
{
    switch (family) {
        case Network::IPV4:
            return "ipv4";
        case Network::IPV6:
            return "ipv6";
        default:
            return "unknown";
    }
}

static void
apply_mask(unsigned char *buf, size_t len, int cidr)
{
    size_t i;

    for (i = 0; i < len; i++) {
        int bits = cidr - (int)(i * 8);
        if (bits >= 8)
            continue;
        if (bits <= 0)
            buf[i] = 0;
        else
            buf[i] &= (unsigned char)(0xff << (8 - bits));
    }
}

Network::Network()
{
    _cidr   = -1;
    _family = UNKNOWN;
}

Network::Network(const string& input)
{
    _cidr   = -1;
    _family = UNKNOWN;
    parse(input);
}

/*
 * returns false (and leaves the entry in the UNKNOWN family) when
 * the input is not an address or CIDR. such entries are most likely
 * hostnames.
 */
bool
Network::parse(const string& input)
{
    unsigned char buf[sizeof(struct in6_addr)];
    char str[INET6_ADDRSTRLEN];
    string address, prefix;
    int af, cidr = -1;
    size_t pos;

    _original = boost::trim_copy(input);
    _address  = _original;
    _cidr     = -1;
    _family   = UNKNOWN;

    pos = _original.find('/');
    if (pos != string::npos) {
        address = _original.substr(0, pos);
        prefix  = _original.substr(pos + 1);
        if (prefix.empty())
            return false;
    } else {
        address = _original;
    }

    if (inet_pton(AF_INET, address.c_str(), buf) == 1) {
        af = AF_INET;
        _family = IPV4;
    } else if (inet_pton(AF_INET6, address.c_str(), buf) == 1) {
        af = AF_INET6;
        _family = IPV6;
    } else {
        log_msg("Network::parse(%s): not an address", _original.c_str());
        return false;
    }

    if (!prefix.empty()) {
        if (boost::all(prefix, boost::is_digit())) {
            if (!parse_number(prefix, cidr))
                cidr = -1;
        } else if (_family == IPV4 && !netmask_to_cidr(prefix, cidr)) {
            cidr = -1;
        }
        if (cidr < 0 || cidr > get_max_cidr()) {
            log_msg("Network::parse(%s): bad prefix", _original.c_str());
            _family = UNKNOWN;
            return false;
        }
        apply_mask(buf, af == AF_INET ? 4 : 16, cidr);
    }

    if (inet_ntop(af, buf, str, sizeof(str)) == NULL) {
        _family = UNKNOWN;
        return false;
    }
    _address = str;
    _cidr    = cidr;
    return true;
}

bool
Network::netmask_to_cidr(const string& mask, int& cidr)
{
    unsigned char buf[sizeof(struct in_addr)];
    bool zero_seen = false;
    int i, bit;

    if (inet_pton(AF_INET, mask.c_str(), buf) != 1)
        return false;

    cidr = 0;
    for (i = 0; i < 4; i++) {
        for (bit = 7; bit >= 0; bit--) {
            if (buf[i] & (1 << bit)) {
                if (zero_seen)
                    return false;
                cidr++;
            } else {
                zero_seen = true;
            }
        }
    }
    return true;
}

int
Network::get_max_cidr() const
{
    if (_family == IPV4)
        return 32;
    if (_family == IPV6)
        return 128;
    return -1;
}

bool
Network::is_host() const
{
    if (_family == UNKNOWN)
        return false;
    return _cidr < 0 || _cidr == get_max_cidr();
}

bool
Network::is_any() const
{
    bool ipv4, ipv6;

    if (is_any_sentinel(_original, ipv4, ipv6))
        return true;
    return _family != UNKNOWN && _cidr == 0;
}

string
Network::get_member() const
{
    if (_family == UNKNOWN || is_host())
        return _address;
    return _address + "/" + my_itoa(_cidr);
}

bool
Network::is_any_sentinel(const string& s, bool& ipv4, bool& ipv6)
{
    string tmp = boost::to_lower_copy(boost::trim_copy(s));

    ipv4 = false;
    ipv6 = false;
    if (tmp == "all" || tmp == "any") {
        ipv4 = true;
        ipv6 = true;
    } else if (tmp == "0.0.0.0/0" || tmp == "0.0.0.0") {
        ipv4 = true;
    } else if (tmp == "::/0" || tmp == "::") {
        ipv6 = true;
    }
    return ipv4 || ipv6;
}

void
Network::print() const
{
    cout << "original: [" << _original << "]" << endl;
    cout << "family: [" << family_tag(_family) << "]" << endl;
    cout << "address: [" << _address << "]" << endl;
    if (_cidr >= 0) {
        cout << "cidr: [" << _cidr << "]" << endl;
    }
}

void
normalize_networks(const vector<string>& input, vector<string>& output)
{
    set<string> seen;

    BOOST_FOREACH(const string& entry, input) {
        vector<string> tokens;
        split_list(entry, tokens);
        BOOST_FOREACH(const string& token, tokens) {
            if (seen.insert(token).second)
                output.push_back(token);
        }
    }
}

NetworkGroups::NetworkGroups()
{
    _open[Network::IPV4] = false;
    _open[Network::IPV6] = false;
}

void
NetworkGroups::classify(const vector<string>& input)
{
    int i;

    _originals.clear();
    for (i = 0; i < Network::FAMILY_LAST; i++)
        _groups[i].clear();
    _ignored.clear();
    _open[Network::IPV4] = false;
    _open[Network::IPV6] = false;

    normalize_networks(input, _originals);

    // any "anywhere" entry opens the rule. only hostnames and the entries
    // of a family that stays closed are kept then, for the warnings
    vector<Network> unknown, closed;
    BOOST_FOREACH(const string& s, _originals) {
        bool ipv4, ipv6;
        if (Network::is_any_sentinel(s, ipv4, ipv6)) {
            _open[Network::IPV4] = _open[Network::IPV4] || ipv4;
            _open[Network::IPV6] = _open[Network::IPV6] || ipv6;
            continue;
        }
        Network net(s);
        if (net.get_family() == Network::UNKNOWN)
            unknown.push_back(net);
        else if (net.is_any())
            _open[net.get_family()] = true;
        else
            closed.push_back(net);
    }
    if (is_open()) {
        _groups[Network::UNKNOWN] = unknown;
        BOOST_FOREACH(const Network& net, closed) {
            if (!_open[net.get_family()])
                _ignored.push_back(net);
        }
        log_msg("classify: open rule (ipv4 %d, ipv6 %d), %d ignored",
                _open[Network::IPV4], _open[Network::IPV6],
                (int)_ignored.size());
        return;
    }

    set<string> members[Network::FAMILY_LAST];
    BOOST_FOREACH(const string& s, _originals) {
        Network net(s);
        enum Network::FAMILY family = net.get_family();
        if (!members[family].insert(net.get_member()).second) {
            log_msg("classify: duplicate [%s]", s.c_str());
            continue;
        }
        _groups[family].push_back(net);
    }
}

bool
NetworkGroups::is_open() const
{
    return _open[Network::IPV4] || _open[Network::IPV6];
}

bool
NetworkGroups::is_open(enum Network::FAMILY family) const
{
    if (family == Network::UNKNOWN)
        return false;
    return _open[family];
}

bool
NetworkGroups::empty(enum Network::FAMILY family) const
{
    return _groups[family].empty();
}

const vector<Network>&
NetworkGroups::get(enum Network::FAMILY family) const
{
    return _groups[family];
}

void
NetworkGroups::print() const
{
    int i;

    for (i = 0; i < Network::FAMILY_LAST; i++) {
        enum Network::FAMILY family = (enum Network::FAMILY)i;
        cout << family_tag(family) << ":";
        if (is_open(family))
            cout << " (open)";
        BOOST_FOREACH(const Network& net, _groups[i]) {
            cout << " " << net.get_member();
        }
        cout << endl;
    }
}

} // end namespace fwtrust
