#include <fstream>
#include <exception>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include "rule_file.hpp"
#include "util.hpp"

using namespace std;
using namespace boost::property_tree;

namespace fwtrust { // begin namespace fwtrust

static void
get_list(const ptree& section, const string& key, vector<string>& v)
{
    string value = section.get<string>(key, "");

    split_list(value, v);
}

static bool
parse_rule(const string& section_name, const ptree& section,
           RuleParams& params, string& err)
{
    string order;

    params.name = boost::trim_copy(section.get<string>("name", section_name));
    params.protocol = boost::trim_copy(section.get<string>("protocol",
                                                           params.protocol));
    params.apply_to = boost::trim_copy(section.get<string>("apply_to",
                                                           params.apply_to));
    params.prefix = boost::trim_copy(section.get<string>("prefix", ""));
    params.zone = boost::trim_copy(section.get<string>("zone", ""));
    get_list(section, "ports", params.ports);
    get_list(section, "icmp_blocks", params.icmp_blocks);
    get_list(section, "trusted_nets", params.trusted_nets);

    order = boost::trim_copy(section.get<string>("order", ""));
    if (!order.empty()) {
        try {
            params.order = boost::lexical_cast<int>(order);
        }
        catch (boost::bad_lexical_cast&) {
            err  = "rule [";
            err += section_name + "]: invalid order '" + order + "'";
            return false;
        }
    }
    return true;
}

bool
read_rules(istream& input, vector<RuleParams>& rules, string& err)
{
    ptree pt;

    try {
        read_ini(input, pt);
    }
    catch (exception& e) {
        err = e.what();
        return false;
    }

    BOOST_FOREACH(const ptree::value_type& val, pt) {
        if (val.first == "global")
            continue;
        if (val.second.empty()) {
            err  = "unexpected key [";
            err += val.first + "] outside of a rule section";
            return false;
        }
        RuleParams params;
        if (!parse_rule(val.first, val.second, params, err))
            return false;
        log_msg("read_rules: rule [%s]", params.name.c_str());
        rules.push_back(params);
    }
    return true;
}

bool
load_rules(const string& file, vector<RuleParams>& rules, string& err)
{
    ifstream input(file.c_str());

    if (!input.is_open()) {
        err = "unable to open rule file [" + file + "]";
        return false;
    }
    if (!read_rules(input, rules, err)) {
        err = file + ": " + err;
        return false;
    }
    return true;
}

} // end namespace fwtrust
