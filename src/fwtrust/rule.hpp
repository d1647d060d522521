#ifndef _FWTRUST_RULE_HPP_
#define _FWTRUST_RULE_HPP_

#include <string>
#include <vector>

#include "network.hpp"

namespace fwtrust { // begin namespace fwtrust

class Rule
{
public:
    enum PROTOCOL {
        TCP = 0,
        UDP,
        ICMP,
        AH,
        ESP,
        ALL,
        PROTOCOL_INVALID
    };

    Rule(const std::string& name, enum PROTOCOL protocol,
         enum Network::FAMILY family, const std::string& zone);

    void set_source(const std::string& ipset);
    void set_service(const std::string& service);
    void set_icmp_blocks(const std::vector<std::string>& icmp_blocks);
    void set_origin(const std::string& origin) { _origin = origin; };

    /*
     * Render the firewalld rich rule text(s). A rule blocking several
     * ICMP types renders one text per type.
     */
    bool rich_rules(std::vector<std::string>& rules, std::string& err) const;

    const std::string&   get_name() const { return _name; };
    enum PROTOCOL        get_protocol() const { return _protocol; };
    enum Network::FAMILY get_family() const { return _family; };
    const std::string&   get_zone() const { return _zone; };
    const std::string&   get_source() const { return _source; };
    const std::string&   get_service() const { return _service; };
    const std::string&   get_origin() const { return _origin; };
    const std::vector<std::string>& get_icmp_blocks() const {
        return _icmp_blocks;
    };
    bool                 is_open() const { return _source.empty(); };
    bool                 same_content(const Rule& other) const;
    void                 print() const;

    static enum PROTOCOL map_protocol(const std::string& protocol);
    static std::string   protocol_string(enum PROTOCOL protocol);

private:
    std::string get_protocol_value() const;

    std::string               _name;
    enum PROTOCOL             _protocol;
    enum Network::FAMILY      _family;
    std::string               _zone;
    std::string               _source;
    std::string               _service;
    std::vector<std::string>  _icmp_blocks;
    std::string               _origin;
};

} // end namespace fwtrust

#endif /* _FWTRUST_RULE_HPP_ */
