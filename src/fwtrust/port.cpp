#include <netdb.h>
#include <arpa/inet.h>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include "port.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

Port::Port(const string& port, const string& protocol) :
    _port(port), _protocol(protocol)
{
}

string
Port::to_string() const
{
    return _port + "/" + _protocol;
}

bool
Port::operator==(const Port& other) const
{
    return _port == other._port && _protocol == other._protocol;
}

bool
is_port_protocol(const string& protocol)
{
    return protocol == "tcp" || protocol == "udp"
        || protocol == "sctp" || protocol == "dccp";
}

static bool
resolve_port(const string& entry, const string& protocol, string& port,
             string& err)
{
    string range_s, range_e;
    int start, stop, number;

    if (is_port_range(entry, range_s, range_e)) {
        if (!is_valid_port_range(range_s, range_e, start, stop, err))
            return false;
        port = my_itoa(start) + "-" + my_itoa(stop);
        return true;
    }
    if (boost::all(entry, boost::is_digit())) {
        if (!is_valid_port_number(entry, number, err))
            return false;
        port = my_itoa(number);
        return true;
    }

    struct servent *se = getservbyname(entry.c_str(), protocol.c_str());
    if (!se) {
        err  = "'";
        err += entry + "' is not a valid port name for protocol '"
            + protocol + "'";
        return false;
    }
    port = my_itoa(ntohs(se->s_port));
    return true;
}

static void
add_port(vector<Port>& ports, const Port& port)
{
    BOOST_FOREACH(const Port& p, ports) {
        if (p == port) {
            log_msg("add_port: duplicate [%s]", port.to_string().c_str());
            return;
        }
    }
    ports.push_back(port);
}

bool
parse_ports(const vector<string>& input, const string& protocol,
            vector<Port>& ports, string& err)
{
    vector<string> entries;

    BOOST_FOREACH(const string& s, input) {
        split_list(s, entries);
    }

    BOOST_FOREACH(const string& entry, entries) {
        string port_str(entry), proto;
        vector<string> protocols;
        size_t pos;

        pos = entry.find('/');
        if (pos != string::npos) {
            port_str = entry.substr(0, pos);
            proto    = boost::to_lower_copy(entry.substr(pos + 1));
            if (!is_port_protocol(proto)) {
                err  = "invalid port protocol '";
                err += proto + "' in '" + entry + "'";
                return false;
            }
            protocols.push_back(proto);
        } else if (protocol == "all") {
            protocols.push_back("tcp");
            protocols.push_back("udp");
        } else if (is_port_protocol(protocol)) {
            protocols.push_back(protocol);
        } else {
            err  = "ports can only be specified when protocol is 'tcp', ";
            err += "'udp' or 'all' (currently '" + protocol + "')";
            return false;
        }

        BOOST_FOREACH(const string& p, protocols) {
            string port;
            if (!resolve_port(port_str, p, port, err))
                return false;
            add_port(ports, Port(port, p));
        }
    }
    return true;
}

} // end namespace fwtrust
