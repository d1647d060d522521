#ifndef _FWTRUST_PLAN_HPP_
#define _FWTRUST_PLAN_HPP_

#include <string>
#include <vector>
#include <utility>

#include "address_set.hpp"
#include "rule.hpp"
#include "service.hpp"

namespace fwtrust { // begin namespace fwtrust

/*
 * The output of a compilation: the objects to request from firewalld,
 * the ordering constraints between them and the diagnostics produced
 * along the way. Objects with the same name are requested once.
 */
class Plan
{
public:
    enum TYPE {
        IPSET = 0,
        SERVICE,
        ZONE_SERVICE,
        RICH_RULE,
        TYPE_LAST
    };

    struct Ref {
        Ref(enum TYPE t, const std::string& n) : type(t), name(n) {}
        bool operator==(const Ref& other) const {
            return type == other.type && name == other.name;
        }
        enum TYPE   type;
        std::string name;
    };
    typedef std::pair<Ref, Ref> Edge;

    Plan();

    bool add_set(const AddressSet& set, std::string& err);
    bool add_service(const Service& service, std::string& err);
    bool add_rule(const Rule& rule, std::string& err);
    void add_edge(const Ref& before, const Ref& after);
    void add_warning(const std::string& warning);
    bool merge(const Plan& other, std::string& err);

    /*
     * All requests, every one after the requests it depends on. Ties are
     * broken by insertion order.
     */
    bool ordered(std::vector<Ref>& refs, std::string& err) const;
    bool is_before(const Ref& before, const Ref& after) const;

    const AddressSet *find_set(const std::string& name) const;
    const Service    *find_service(const std::string& name) const;
    const Rule       *find_rule(const std::string& name) const;

    const std::vector<AddressSet>&  get_sets() const { return _sets; };
    const std::vector<Service>&     get_services() const { return _services; };
    const std::vector<Rule>&        get_rules() const { return _rules; };
    const std::vector<Edge>&        get_edges() const { return _edges; };
    const std::vector<std::string>& get_warnings() const { return _warnings; };
    const std::vector<Ref>&         get_refs() const { return _refs; };
    size_t count(enum TYPE type) const;
    bool   empty() const { return _refs.empty(); };
    void   print() const;

    static std::string type_string(enum TYPE type);

private:
    std::vector<AddressSet>   _sets;
    std::vector<Service>      _services;
    std::vector<Rule>         _rules;
    std::vector<Ref>          _refs;
    std::vector<Edge>         _edges;
    std::vector<std::string>  _warnings;
};

} // end namespace fwtrust

#endif /* _FWTRUST_PLAN_HPP_ */
