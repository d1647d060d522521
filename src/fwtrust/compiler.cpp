#include <iostream>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include "compiler.hpp"
#include "naming.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

Compiler::Compiler(const Config& config) :
    _config(config)
{
}

enum Compiler::APPLY_TO
Compiler::map_apply_to(const string& apply_to)
{
    string a = boost::to_lower_copy(boost::trim_copy(apply_to));

    if (a == "ipv4")
        return APPLY_IPV4;
    else if (a == "ipv6")
        return APPLY_IPV6;
    else if (a == "all")
        return APPLY_ALL;
    else if (a == "auto" || a.empty())
        return APPLY_AUTO;
    else
        return APPLY_INVALID;
}

void
Compiler::resolve_families(enum APPLY_TO apply_to,
                           const NetworkGroups& groups, const string& name,
                           Plan& plan, bool families[Network::UNKNOWN]) const
{
    int i;

    for (i = 0; i < Network::UNKNOWN; i++) {
        enum Network::FAMILY family = (enum Network::FAMILY)i;
        bool selected;

        switch (apply_to) {
            case APPLY_IPV4:
                selected = (family == Network::IPV4);
                break;
            case APPLY_IPV6:
                selected = (family == Network::IPV6);
                break;
            case APPLY_ALL:
                selected = true;
                break;
            default:
                if (groups.is_open())
                    selected = groups.is_open(family);
                else
                    selected = !groups.empty(family);
                break;
        }

        // an open rule never opens a family no sentinel opened
        families[i] = selected;
        if (groups.is_open() && !groups.is_open(family)) {
            families[i] = false;
            if (selected) {
                plan.add_warning("rule [" + name + "]: apply_to selects "
                                 + family_tag(family) + " but only "
                                 + family_tag(family == Network::IPV4
                                              ? Network::IPV6
                                              : Network::IPV4)
                                 + " is open to all sources, no "
                                 + family_tag(family) + " rule emitted");
            }
        }
        if (!families[i] && !groups.empty(family)) {
            string w = "rule [" + name + "] applies to "
                + (family == Network::IPV4 ? "ipv6" : "ipv4")
                + " only, ignoring " + family_tag(family) + " networks";
            plan.add_warning(w);
        }
        log_msg("resolve_families(%s): %s %d", name.c_str(),
                family_tag(family), families[i]);
    }
}

bool
Compiler::compile(const RuleParams& params, Plan& plan, string& err) const
{
    enum Rule::PROTOCOL protocol;
    enum APPLY_TO apply_to;
    string prefix, zone;
    vector<string> icmp_blocks;
    vector<Port> ports;
    bool families[Network::UNKNOWN];
    Plan local;

    if (!_config.enabled()) {
        plan.add_warning("firewall rule management is disabled, skipping rule ["
                         + params.name + "]");
        return true;
    }

    if (params.name.empty()) {
        err = "rule name must not be empty";
        return false;
    }
    protocol = Rule::map_protocol(params.protocol);
    if (protocol == Rule::PROTOCOL_INVALID) {
        err  = "rule [";
        err += params.name + "]: invalid protocol '" + params.protocol
            + "' (must be one of tcp, udp, icmp, ah, esp, all)";
        return false;
    }
    apply_to = map_apply_to(params.apply_to);
    if (apply_to == APPLY_INVALID) {
        err  = "rule [";
        err += params.name + "]: invalid apply_to '" + params.apply_to
            + "' (must be one of ipv4, ipv6, all, auto)";
        return false;
    }
    if (params.order < 0) {
        err  = "rule [";
        err += params.name + "]: order must not be negative";
        return false;
    }

    prefix = params.prefix.empty() ? _config.prefix() : params.prefix;
    zone   = params.zone.empty() ? _config.zone() : params.zone;

    if (!params.ports.empty()) {
        if (protocol == Rule::TCP || protocol == Rule::UDP
            || protocol == Rule::ALL) {
            if (!parse_ports(params.ports, Rule::protocol_string(protocol),
                             ports, err)) {
                err = "rule [" + params.name + "]: " + err;
                return false;
            }
        } else {
            local.add_warning("rule [" + params.name + "]: ports are ignored "
                              "for protocol "
                              + Rule::protocol_string(protocol));
        }
    }

    BOOST_FOREACH(const string& s, params.icmp_blocks) {
        split_list(s, icmp_blocks);
    }
    if (!icmp_blocks.empty() && protocol != Rule::ICMP) {
        local.add_warning("rule [" + params.name + "]: icmp_blocks are "
                          "ignored for protocol "
                          + Rule::protocol_string(protocol));
        icmp_blocks.clear();
    }

    NetworkGroups groups;
    groups.classify(params.trusted_nets);
    BOOST_FOREACH(const Network& net, groups.get(Network::UNKNOWN)) {
        local.add_warning("rule [" + params.name + "]: '"
                          + net.get_original() + "' is not an IP address "
                          + "or network and will not be trusted");
    }

    BOOST_FOREACH(const Network& net, groups.get_ignored()) {
        string open = family_tag(net.get_family() == Network::IPV4
                                 ? Network::IPV6 : Network::IPV4);
        if (!ports.empty())
            local.add_warning("rule [" + params.name + "]: '"
                              + net.get_original() + "' is covered by the "
                              + "zone service, the ports are open to all "
                              + "sources");
        else
            local.add_warning("rule [" + params.name + "]: '"
                              + net.get_original() + "' is ignored, the rule "
                              + "only opens " + open + " to all sources");
    }

    // open rule with ports: the service goes straight into the zone
    if (groups.is_open() && !ports.empty()) {
        Service service(service_name(prefix, params.name), ports);
        service.set_zone(zone);
        service.set_origin(params.name);
        if (!local.add_service(service, err))
            return false;
        return plan.merge(local, err);
    }

    resolve_families(apply_to, groups, params.name, local, families);

    vector<AddressSet> sets;
    vector<Rule> rules;
    int i;

    for (i = 0; i < Network::UNKNOWN; i++) {
        enum Network::FAMILY family = (enum Network::FAMILY)i;
        if (!families[i])
            continue;

        if (groups.is_open()) {
            Rule rule(rule_name(params.order, params.name, family_tag(family)),
                      protocol, family, zone);
            rules.push_back(rule);
            continue;
        }

        vector<AddressSet> family_sets;
        partition_networks(groups, family, prefix, family_sets);
        BOOST_FOREACH(const AddressSet& set, family_sets) {
            Rule rule(rule_name(params.order, params.name, set.get_name()),
                      protocol, family, zone);
            rule.set_source(set.get_name());
            rules.push_back(rule);
            sets.push_back(set);
        }
    }

    if (rules.empty()) {
        local.add_warning("rule [" + params.name + "]: no usable trusted "
                          "networks, nothing to do");
        return plan.merge(local, err);
    }

    string svc;
    if (!ports.empty()) {
        Service service(service_name(prefix, params.name), ports);
        service.set_origin(params.name);
        svc = service.get_name();
        if (!local.add_service(service, err))
            return false;
    }

    BOOST_FOREACH(const AddressSet& set, sets) {
        if (!local.add_set(set, err))
            return false;
    }

    BOOST_FOREACH(Rule& rule, rules) {
        vector<string> texts;
        Plan::Ref ref(Plan::RICH_RULE, rule.get_name());

        rule.set_origin(params.name);
        if (!svc.empty())
            rule.set_service(svc);
        if (protocol == Rule::ICMP)
            rule.set_icmp_blocks(icmp_blocks);
        if (!rule.rich_rules(texts, err))
            return false;
        if (!local.add_rule(rule, err))
            return false;
        if (!svc.empty())
            local.add_edge(Plan::Ref(Plan::SERVICE, svc), ref);
        if (!rule.is_open())
            local.add_edge(Plan::Ref(Plan::IPSET, rule.get_source()), ref);
    }

    return plan.merge(local, err);
}

bool
Compiler::compile(const vector<RuleParams>& rules, Plan& plan,
                  string& err) const
{
    BOOST_FOREACH(const RuleParams& params, rules) {
        if (!compile(params, plan, err))
            return false;
    }
    return true;
}

} // end namespace fwtrust
