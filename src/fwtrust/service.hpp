#ifndef _FWTRUST_SERVICE_HPP_
#define _FWTRUST_SERVICE_HPP_

#include <string>
#include <vector>

#include "port.hpp"

namespace fwtrust { // begin namespace fwtrust

class Service
{
public:
    Service(const std::string& name, const std::vector<Port>& ports);

    void                     set_zone(const std::string& zone);
    void                     set_origin(const std::string& origin) {
        _origin = origin;
    };
    const std::string&       get_origin() const { return _origin; };
    const std::string&       get_name() const { return _name; };
    const std::vector<Port>& get_ports() const { return _ports; };
    const std::string&       get_zone() const { return _zone; };
    bool                     is_zone_bound() const { return !_zone.empty(); };
    bool                     same_content(const Service& other) const;
    void                     print() const;

private:
    std::string         _name;
    std::vector<Port>   _ports;
    std::string         _zone;
    std::string         _origin;
};

} // end namespace fwtrust

#endif /* _FWTRUST_SERVICE_HPP_ */
