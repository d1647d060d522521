#include <iostream>

#include <boost/foreach.hpp>

#include "address_set.hpp"
#include "naming.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

const char *
kind_tag(enum AddressSet::KIND kind)
{
    switch (kind) {
        case AddressSet::HOST:
            return "host";
        case AddressSet::NET:
            return "net";
        default:
            return "invalid";
    }
}

AddressSet::AddressSet(const string& name, enum KIND kind,
                       enum Network::FAMILY family) :
    _name(name), _kind(kind), _family(family)
{
}

bool
AddressSet::add_member(const Network& net, string& err)
{
    if (net.get_family() != _family) {
        err  = "[";
        err += net.get_original() + "] is not a valid "
            + family_tag(_family) + " member of set [" + _name + "]";
        return false;
    }
    if ((_kind == HOST) != net.is_host()) {
        err  = "Can't mix host and network [";
        err += net.get_original() + "] in set [" + _name + "]";
        return false;
    }
    _members.insert(net.get_member());
    return true;
}

string
AddressSet::get_type_string() const
{
    if (_kind == HOST)
        return "hash:ip";
    return "hash:net";
}

string
AddressSet::get_family_option() const
{
    if (_family == Network::IPV6)
        return "inet6";
    return "inet";
}

bool
AddressSet::same_content(const AddressSet& other) const
{
    return _name == other._name && _kind == other._kind
        && _family == other._family && _members == other._members;
}

void
AddressSet::print() const
{
    cout << "ipset " << _name << " type " << get_type_string()
         << " family " << get_family_option() << endl;
    BOOST_FOREACH(const string& m, _members) {
        cout << "  " << m << endl;
    }
}

void
partition_networks(const NetworkGroups& groups, enum Network::FAMILY family,
                   const string& prefix, vector<AddressSet>& sets)
{
    string err;
    int i;

    if (family == Network::UNKNOWN || groups.is_open(family))
        return;

    for (i = 0; i < AddressSet::KIND_LAST; i++) {
        enum AddressSet::KIND kind = (enum AddressSet::KIND)i;
        string name = ipset_name(prefix, family_tag(family), kind_tag(kind),
                                 groups.get_originals());
        AddressSet set(name, kind, family);

        BOOST_FOREACH(const Network& net, groups.get(family)) {
            if ((kind == AddressSet::HOST) != net.is_host())
                continue;
            if (!set.add_member(net, err)) {
                // can't happen, the family and kind were checked above
                cerr << "Warning: " << err << endl;
            }
        }
        if (set.empty())
            continue;
        log_msg("partition_networks: %s %s [%s] %d members",
                family_tag(family), kind_tag(kind), name.c_str(),
                (int)set.get_members().size());
        sets.push_back(set);
    }
}

} // end namespace fwtrust
