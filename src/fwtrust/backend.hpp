#ifndef _FWTRUST_BACKEND_HPP_
#define _FWTRUST_BACKEND_HPP_

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "plan.hpp"

namespace fwtrust { // begin namespace fwtrust

/*
 * the firewall daemon's configuration interface. every request must be
 * safe to repeat: creating an object that already exists is a no-op.
 */
class Backend
{
public:
    virtual ~Backend() {}

    virtual bool create_ipset(const AddressSet& set, std::string& err) = 0;
    virtual bool create_service(const Service& service, std::string& err) = 0;
    virtual bool bind_service(const Service& service, std::string& err) = 0;
    virtual bool add_rich_rule(const Rule& rule, std::string& err) = 0;
};

/*
 * issue the plan's requests in dependency order, stop at the first
 * failure.
 */
extern bool apply_plan(const Plan& plan, Backend& backend, std::string& err);

/*
 * firewall-cmd --permanent requests. with a script stream the commands
 * are only written out, otherwise each one is run.
 */
class FirewallCmd : public Backend
{
public:
    enum EXIT_CODES {
        ALREADY_ENABLED = 11,
        NAME_CONFLICT = 26
    };

    explicit FirewallCmd(const std::string& cmd, std::ostream *script = NULL);

    virtual bool create_ipset(const AddressSet& set, std::string& err);
    virtual bool create_service(const Service& service, std::string& err);
    virtual bool bind_service(const Service& service, std::string& err);
    virtual bool add_rich_rule(const Rule& rule, std::string& err);

    const std::vector<std::string>& get_commands() const { return _commands; };

    static std::string shell_quote(const std::string& s);

private:
    bool run(const std::string& args, std::string& err);

    std::string               _cmd;
    std::ostream             *_script;
    std::vector<std::string>  _commands;
};

} // end namespace fwtrust

#endif /* _FWTRUST_BACKEND_HPP_ */
