#ifndef _FWTRUST_PORT_HPP_
#define _FWTRUST_PORT_HPP_

#include <string>
#include <vector>

namespace fwtrust { // begin namespace fwtrust

class Port
{
public:
    Port(const std::string& port, const std::string& protocol);

    const std::string& get_port() const { return _port; };
    const std::string& get_protocol() const { return _protocol; };
    std::string        to_string() const;
    bool               operator==(const Port& other) const;

private:
    std::string   _port;
    std::string   _protocol;
};

/*
 * Parse port entries ("80", "1024-2048", "1024:2048", "ssh", "53/udp").
 * Entries without their own protocol use 'protocol'; "all" expands into
 * a tcp and a udp port. Ranges are always emitted hyphenated.
 */
extern bool parse_ports(const std::vector<std::string>& input,
                        const std::string& protocol,
                        std::vector<Port>& ports, std::string& err);

extern bool is_port_protocol(const std::string& protocol);

} // end namespace fwtrust

#endif /* _FWTRUST_PORT_HPP_ */
