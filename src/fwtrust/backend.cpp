#include <cstdlib>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include "backend.hpp"
#include "util.hpp"

using namespace std;

namespace fwtrust { // begin namespace fwtrust

bool
apply_plan(const Plan& plan, Backend& backend, string& err)
{
    vector<Plan::Ref> refs;

    if (!plan.ordered(refs, err))
        return false;

    BOOST_FOREACH(const Plan::Ref& ref, refs) {
        bool rc = false;

        log_msg("apply_plan: %s %s", Plan::type_string(ref.type).c_str(),
                ref.name.c_str());
        switch (ref.type) {
            case Plan::IPSET:
                rc = backend.create_ipset(*plan.find_set(ref.name), err);
                break;
            case Plan::SERVICE:
                rc = backend.create_service(*plan.find_service(ref.name), err);
                break;
            case Plan::ZONE_SERVICE:
                rc = backend.bind_service(*plan.find_service(ref.name), err);
                break;
            case Plan::RICH_RULE:
                rc = backend.add_rich_rule(*plan.find_rule(ref.name), err);
                break;
            default:
                err  = "unexpected request type for [";
                err += ref.name + "]";
                break;
        }
        if (!rc)
            return false;
    }
    return true;
}

FirewallCmd::FirewallCmd(const string& cmd, ostream *script) :
    _cmd(cmd), _script(script)
{
}

string
FirewallCmd::shell_quote(const string& s)
{
    return "'" + boost::replace_all_copy(s, "'", "'\\''") + "'";
}

/*
 * "already there" answers are success, the requests are create-or-reuse.
 */
bool
FirewallCmd::run(const string& args, string& err)
{
    string cmd = _cmd + " --permanent " + args;
    int rc, status;

    _commands.push_back(cmd);
    if (_script) {
        *_script << cmd << endl;
        return true;
    }

    log_msg("run: %s", cmd.c_str());
    rc = system((cmd + " >/dev/null 2>&1").c_str());
    if (rc == -1) {
        err  = "unable to run [";
        err += cmd + "]";
        return false;
    }
    if (!WIFEXITED(rc)) {
        err  = "[";
        err += cmd + "] terminated abnormally";
        return false;
    }
    status = WEXITSTATUS(rc);
    if (status == 0 || status == ALREADY_ENABLED || status == NAME_CONFLICT)
        return true;

    err  = "firewall-cmd failed on [";
    err += cmd + "] = " + my_itoa(status);
    return false;
}

bool
FirewallCmd::create_ipset(const AddressSet& set, string& err)
{
    string args;

    args  = "--new-ipset=" + shell_quote(set.get_name());
    args += " --type=" + set.get_type_string();
    args += " --option=family=" + set.get_family_option();
    if (!run(args, err))
        return false;

    BOOST_FOREACH(const string& member, set.get_members()) {
        args  = "--ipset=" + shell_quote(set.get_name());
        args += " --add-entry=" + shell_quote(member);
        if (!run(args, err))
            return false;
    }
    return true;
}

bool
FirewallCmd::create_service(const Service& service, string& err)
{
    string args;

    args = "--new-service=" + shell_quote(service.get_name());
    if (!run(args, err))
        return false;

    BOOST_FOREACH(const Port& port, service.get_ports()) {
        args  = "--service=" + shell_quote(service.get_name());
        args += " --add-port=" + port.to_string();
        if (!run(args, err))
            return false;
    }
    return true;
}

bool
FirewallCmd::bind_service(const Service& service, string& err)
{
    string args;

    if (!service.is_zone_bound()) {
        err  = "service [";
        err += service.get_name() + "] has no zone";
        return false;
    }
    if (!create_service(service, err))
        return false;

    args  = "--zone=" + shell_quote(service.get_zone());
    args += " --add-service=" + shell_quote(service.get_name());
    return run(args, err);
}

bool
FirewallCmd::add_rich_rule(const Rule& rule, string& err)
{
    vector<string> texts;
    string args;

    if (!rule.rich_rules(texts, err))
        return false;

    BOOST_FOREACH(const string& text, texts) {
        args  = "--zone=" + shell_quote(rule.get_zone());
        args += " --add-rich-rule=" + shell_quote(text);
        if (!run(args, err))
            return false;
    }
    return true;
}

} // end namespace fwtrust
