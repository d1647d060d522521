#include <iostream>
#include <regex.h>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include "rule.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

static bool
is_valid_icmp_type(const string& type)
{
    static regex_t icmp_regex;
    static bool compiled = false;
    int rc;

    if (!compiled) {
        const char *pattern = "^[a-z0-9][a-z0-9-]*$";
        if (0 != (rc = regcomp(&icmp_regex, pattern,
                               REG_EXTENDED|REG_NOSUB))) {
            cerr << "regcomp() failed (" << rc << ")" << endl;
            return false;
        }
        compiled = true;
    }
    rc = regexec(&icmp_regex, type.c_str(), 0, NULL, 0);
    return rc ? false : true;
}

Rule::Rule(const string& name, enum PROTOCOL protocol,
           enum Network::FAMILY family, const string& zone) :
    _name(name), _protocol(protocol), _family(family), _zone(zone)
{
}

void
Rule::set_source(const string& ipset)
{
    _source = ipset;
}

void
Rule::set_service(const string& service)
{
    _service = service;
}

void
Rule::set_icmp_blocks(const vector<string>& icmp_blocks)
{
    _icmp_blocks = icmp_blocks;
}

enum Rule::PROTOCOL
Rule::map_protocol(const string& protocol)
{
    string p = boost::to_lower_copy(boost::trim_copy(protocol));

    if (p == "tcp")
        return TCP;
    else if (p == "udp")
        return UDP;
    else if (p == "icmp")
        return ICMP;
    else if (p == "ah")
        return AH;
    else if (p == "esp")
        return ESP;
    else if (p == "all")
        return ALL;
    else
        return PROTOCOL_INVALID;
}

string
Rule::protocol_string(enum PROTOCOL protocol)
{
    switch (protocol) {
        case TCP:
            return "tcp";
        case UDP:
            return "udp";
        case ICMP:
            return "icmp";
        case AH:
            return "ah";
        case ESP:
            return "esp";
        case ALL:
            return "all";
        default:
            return "invalid";
    }
}

string
Rule::get_protocol_value() const
{
    if (_protocol == ICMP && _family == Network::IPV6)
        return "ipv6-icmp";
    return protocol_string(_protocol);
}

bool
Rule::rich_rules(vector<string>& rules, string& err) const
{
    string rule_string;

    if (_family == Network::UNKNOWN) {
        err  = "rule [";
        err += _name + "] has no address family";
        return false;
    }
    if (_protocol == PROTOCOL_INVALID) {
        err  = "rule [";
        err += _name + "] has an invalid protocol";
        return false;
    }

    rule_string  = "rule family=\"";
    rule_string += string(family_tag(_family)) + "\"";
    if (!_source.empty()) {
        rule_string += " source ipset=\"" + _source + "\"";
    }

    if (_protocol == ICMP && !_icmp_blocks.empty()) {
        BOOST_FOREACH(const string& type, _icmp_blocks) {
            if (!is_valid_icmp_type(type)) {
                err  = "invalid icmp type [";
                err += type + "] in rule [" + _name + "]";
                return false;
            }
            rules.push_back(rule_string + " icmp-block name=\"" + type
                            + "\"");
        }
        return true;
    }

    if (!_service.empty()) {
        rule_string += " service name=\"" + _service + "\"";
    } else if (_protocol != ALL) {
        rule_string += " protocol value=\"" + get_protocol_value() + "\"";
    }
    rule_string += " accept";
    rules.push_back(rule_string);
    return true;
}

bool
Rule::same_content(const Rule& other) const
{
    return _name == other._name && _protocol == other._protocol
        && _family == other._family && _zone == other._zone
        && _source == other._source && _service == other._service
        && _icmp_blocks == other._icmp_blocks;
}

void
Rule::print() const
{
    cout << "rich-rule " << _name << " zone " << _zone << endl;
    cout << "  family: [" << family_tag(_family) << "]" << endl;
    cout << "  protocol: [" << protocol_string(_protocol) << "]" << endl;
    if (!_source.empty()) {
        cout << "  source: [" << _source << "]" << endl;
    } else {
        cout << "  source: [all]" << endl;
    }
    if (!_service.empty()) {
        cout << "  service: [" << _service << "]" << endl;
    }
    if (!_icmp_blocks.empty()) {
        cout << "  icmp_blocks: [" << join(_icmp_blocks, ",") << "]" << endl;
    }
}

} // end namespace fwtrust
