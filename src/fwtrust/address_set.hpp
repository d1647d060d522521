#ifndef _FWTRUST_ADDRESS_SET_HPP_
#define _FWTRUST_ADDRESS_SET_HPP_

#include <string>
#include <set>
#include <vector>

#include "network.hpp"

namespace fwtrust { // begin namespace fwtrust

class AddressSet
{
public:
    enum KIND {
        HOST = 0,
        NET,
        KIND_LAST
    };
    AddressSet(const std::string& name, enum KIND kind,
               enum Network::FAMILY family);

    bool                         add_member(const Network& net,
                                            std::string& err);
    const std::string&           get_name() const { return _name; };
    enum KIND                    get_kind() const { return _kind; };
    enum Network::FAMILY         get_family() const { return _family; };
    const std::set<std::string>& get_members() const { return _members; };
    bool                         empty() const { return _members.empty(); };
    std::string                  get_type_string() const;
    std::string                  get_family_option() const;
    bool                         same_content(const AddressSet& other) const;
    void                         print() const;

private:
    std::string             _name;
    enum KIND               _kind;
    enum Network::FAMILY    _family;
    std::set<std::string>   _members;
};

extern const char *kind_tag(enum AddressSet::KIND kind);

/*
 * Split the entries of one family into a host set and a net set. Empty
 * sets are not returned, nothing is returned for an open family.
 */
extern void partition_networks(const NetworkGroups& groups,
                               enum Network::FAMILY family,
                               const std::string& prefix,
                               std::vector<AddressSet>& sets);

} // end namespace fwtrust

#endif /* _FWTRUST_ADDRESS_SET_HPP_ */
