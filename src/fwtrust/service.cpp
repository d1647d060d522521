#include <iostream>

#include <boost/foreach.hpp>

#include "service.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

Service::Service(const string& name, const vector<Port>& ports) :
    _name(name), _ports(ports)
{
}

void
Service::set_zone(const string& zone)
{
    _zone = zone;
}

bool
Service::same_content(const Service& other) const
{
    return _name == other._name && _ports == other._ports
        && _zone == other._zone;
}

void
Service::print() const
{
    cout << "service " << _name;
    if (!_zone.empty())
        cout << " zone " << _zone;
    cout << endl;
    BOOST_FOREACH(const Port& port, _ports) {
        cout << "  port " << port.to_string() << endl;
    }
}

} // end namespace fwtrust
