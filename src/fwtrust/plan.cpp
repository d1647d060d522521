#include <iostream>

#include <boost/foreach.hpp>

#include "plan.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

Plan::Plan()
{
}

/*
 * the rule names behind a name conflict. the origin is the name of the
 * rule that requested the object.
 */
static string
conflict_origins(const string& a, const string& b)
{
    if (a.empty() || b.empty())
        return "";
    if (a == b)
        return " (rule [" + a + "] is defined twice)";
    return " (rules [" + a + "] and [" + b + "] map to the same name)";
}

string
Plan::type_string(enum TYPE type)
{
    switch (type) {
        case IPSET:
            return "ipset";
        case SERVICE:
            return "service";
        case ZONE_SERVICE:
            return "zone-service";
        case RICH_RULE:
            return "rich-rule";
        default:
            return "invalid";
    }
}

bool
Plan::add_set(const AddressSet& set, string& err)
{
    const AddressSet *existing = find_set(set.get_name());

    if (existing) {
        if (existing->same_content(set)) {
            log_msg("add_set: reusing [%s]", set.get_name().c_str());
            return true;
        }
        err  = "ipset [";
        err += set.get_name() + "] requested twice with different members";
        return false;
    }
    _sets.push_back(set);
    _refs.push_back(Ref(IPSET, set.get_name()));
    return true;
}

bool
Plan::add_service(const Service& service, string& err)
{
    const Service *existing = find_service(service.get_name());

    if (existing) {
        if (existing->same_content(service)) {
            log_msg("add_service: reusing [%s]", service.get_name().c_str());
            return true;
        }
        err  = "service [";
        err += service.get_name() + "] requested twice with different ports"
            + conflict_origins(existing->get_origin(), service.get_origin());
        return false;
    }
    _services.push_back(service);
    _refs.push_back(Ref(service.is_zone_bound() ? ZONE_SERVICE : SERVICE,
                        service.get_name()));
    return true;
}

bool
Plan::add_rule(const Rule& rule, string& err)
{
    const Rule *existing = find_rule(rule.get_name());

    if (existing) {
        if (existing->same_content(rule)) {
            log_msg("add_rule: reusing [%s]", rule.get_name().c_str());
            return true;
        }
        err  = "rich rule [";
        err += rule.get_name() + "] requested twice with different content"
            + conflict_origins(existing->get_origin(), rule.get_origin());
        return false;
    }
    _rules.push_back(rule);
    _refs.push_back(Ref(RICH_RULE, rule.get_name()));
    return true;
}

void
Plan::add_edge(const Ref& before, const Ref& after)
{
    BOOST_FOREACH(const Edge& e, _edges) {
        if (e.first == before && e.second == after)
            return;
    }
    _edges.push_back(Edge(before, after));
}

void
Plan::add_warning(const string& warning)
{
    _warnings.push_back(warning);
}

/*
 * all or nothing: on a conflict this plan is left as it was.
 */
bool
Plan::merge(const Plan& other, string& err)
{
    Plan merged(*this);

    BOOST_FOREACH(const Ref& ref, other._refs) {
        bool rc = false;

        switch (ref.type) {
            case IPSET:
                rc = merged.add_set(*other.find_set(ref.name), err);
                break;
            case SERVICE:
            case ZONE_SERVICE:
                rc = merged.add_service(*other.find_service(ref.name), err);
                break;
            case RICH_RULE:
                rc = merged.add_rule(*other.find_rule(ref.name), err);
                break;
            default:
                err  = "unexpected request type for [";
                err += ref.name + "]";
                break;
        }
        if (!rc)
            return false;
    }
    BOOST_FOREACH(const Edge& e, other._edges) {
        merged.add_edge(e.first, e.second);
    }
    merged._warnings.insert(merged._warnings.end(), other._warnings.begin(),
                            other._warnings.end());
    *this = merged;
    return true;
}

bool
Plan::ordered(vector<Ref>& refs, string& err) const
{
    vector<bool> done(_refs.size(), false);
    size_t emitted = 0;
    size_t i;

    while (emitted < _refs.size()) {
        bool progress = false;
        for (i = 0; i < _refs.size(); i++) {
            if (done[i])
                continue;
            bool ready = true;
            BOOST_FOREACH(const Edge& e, _edges) {
                if (!(e.second == _refs[i]))
                    continue;
                size_t j;
                for (j = 0; j < _refs.size(); j++) {
                    if (_refs[j] == e.first && !done[j]) {
                        ready = false;
                        break;
                    }
                }
                if (!ready)
                    break;
            }
            if (!ready)
                continue;
            refs.push_back(_refs[i]);
            done[i] = true;
            emitted++;
            progress = true;
            break;
        }
        if (!progress) {
            err = "dependency cycle between requests";
            return false;
        }
    }
    return true;
}

bool
Plan::is_before(const Ref& before, const Ref& after) const
{
    vector<Ref> refs;
    string err;
    size_t i;
    int b = -1, a = -1;

    if (!ordered(refs, err))
        return false;
    for (i = 0; i < refs.size(); i++) {
        if (refs[i] == before)
            b = i;
        if (refs[i] == after)
            a = i;
    }
    return b >= 0 && a >= 0 && b < a;
}

const AddressSet *
Plan::find_set(const string& name) const
{
    vector<AddressSet>::const_iterator it;

    for (it = _sets.begin(); it != _sets.end(); it++) {
        if (it->get_name() == name)
            return &(*it);
    }
    return NULL;
}

const Service *
Plan::find_service(const string& name) const
{
    vector<Service>::const_iterator it;

    for (it = _services.begin(); it != _services.end(); it++) {
        if (it->get_name() == name)
            return &(*it);
    }
    return NULL;
}

const Rule *
Plan::find_rule(const string& name) const
{
    vector<Rule>::const_iterator it;

    for (it = _rules.begin(); it != _rules.end(); it++) {
        if (it->get_name() == name)
            return &(*it);
    }
    return NULL;
}

size_t
Plan::count(enum TYPE type) const
{
    size_t n = 0;

    BOOST_FOREACH(const Ref& ref, _refs) {
        if (ref.type == type)
            n++;
    }
    return n;
}

void
Plan::print() const
{
    vector<Ref> refs;
    string err;

    if (!ordered(refs, err)) {
        cerr << "Error: " << err << endl;
        return;
    }
    BOOST_FOREACH(const Ref& ref, refs) {
        switch (ref.type) {
            case IPSET:
                find_set(ref.name)->print();
                break;
            case SERVICE:
            case ZONE_SERVICE:
                find_service(ref.name)->print();
                break;
            case RICH_RULE:
                find_rule(ref.name)->print();
                break;
            default:
                break;
        }
        BOOST_FOREACH(const Edge& e, _edges) {
            if (e.second == ref) {
                cout << "  requires: " << type_string(e.first.type) << " "
                     << e.first.name << endl;
            }
        }
    }
}

} // end namespace fwtrust
