#ifndef _FWTRUST_COMPILER_HPP_
#define _FWTRUST_COMPILER_HPP_

#include <string>
#include <vector>

#include "lib/trust_config.hpp"
#include "plan.hpp"

namespace fwtrust { // begin namespace fwtrust

#define FWTRUST_DEFAULT_ORDER 11

/*
 * one rule instance: allow 'protocol' (and 'ports') from 'trusted_nets'.
 * empty prefix and zone fall back to the global settings.
 */
struct RuleParams
{
    RuleParams() :
        protocol("tcp"), order(FWTRUST_DEFAULT_ORDER), apply_to("auto") {}

    std::string               name;
    std::string               protocol;
    std::vector<std::string>  ports;
    std::vector<std::string>  icmp_blocks;
    std::vector<std::string>  trusted_nets;
    int                       order;
    std::string               apply_to;
    std::string               prefix;
    std::string               zone;
};

class Compiler
{
public:
    enum APPLY_TO {
        APPLY_IPV4 = 0,
        APPLY_IPV6,
        APPLY_ALL,
        APPLY_AUTO,
        APPLY_INVALID
    };

    explicit Compiler(const Config& config);

    /*
     * Compile one rule and merge the result into 'plan'. Returns false
     * only for invalid parameters; unusable networks become warnings.
     */
    bool compile(const RuleParams& params, Plan& plan,
                 std::string& err) const;
    bool compile(const std::vector<RuleParams>& rules, Plan& plan,
                 std::string& err) const;

    static enum APPLY_TO map_apply_to(const std::string& apply_to);

private:
    void resolve_families(enum APPLY_TO apply_to,
                          const NetworkGroups& groups,
                          const std::string& name, Plan& plan,
                          bool families[Network::UNKNOWN]) const;

    const Config&   _config;
};

} // end namespace fwtrust

#endif /* _FWTRUST_COMPILER_HPP_ */
