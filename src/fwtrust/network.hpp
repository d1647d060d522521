#ifndef _FWTRUST_NETWORK_HPP_
#define _FWTRUST_NETWORK_HPP_

#include <string>
#include <vector>

namespace fwtrust { // begin namespace fwtrust

class Network
{
public:
    enum FAMILY {
        IPV4 = 0,
        IPV6,
        UNKNOWN,
        FAMILY_LAST
    };
    Network();
    explicit Network(const std::string& input);

    bool               parse(const std::string& input);
    bool               is_host() const;
    bool               is_any() const;
    enum FAMILY        get_family() const { return _family; };
    const std::string& get_original() const { return _original; };
    const std::string& get_address() const { return _address; };
    int                get_cidr() const { return _cidr; };
    int                get_max_cidr() const;
    std::string        get_member() const;
    void               print() const;

    static bool        is_any_sentinel(const std::string& s, bool& ipv4,
                                       bool& ipv6);

private:
    static bool        netmask_to_cidr(const std::string& mask, int& cidr);

    std::string   _original;
    std::string   _address;
    int           _cidr;
    enum FAMILY   _family;
};

extern const char *family_tag(enum Network::FAMILY family);

/*
 * flatten a list of single addresses and comma/space separated lists into
 * one ordered list without duplicates.
 */
extern void normalize_networks(const std::vector<std::string>& input,
                               std::vector<std::string>& output);

class NetworkGroups
{
public:
    NetworkGroups();
    void classify(const std::vector<std::string>& input);

    bool is_open() const;
    bool is_open(enum Network::FAMILY family) const;
    bool empty(enum Network::FAMILY family) const;
    const std::vector<Network>& get(enum Network::FAMILY family) const;
    const std::vector<std::string>& get_originals() const {
        return _originals;
    };

    /*
     * entries of a family that no sentinel opened, in an open rule. they
     * do not become set members.
     */
    const std::vector<Network>& get_ignored() const { return _ignored; };
    void print() const;

private:
    std::vector<std::string>  _originals;
    std::vector<Network>      _groups[Network::FAMILY_LAST];
    std::vector<Network>      _ignored;
    bool                      _open[Network::UNKNOWN];
};

} // end namespace fwtrust

#endif /* _FWTRUST_NETWORK_HPP_ */
