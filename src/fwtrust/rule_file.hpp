#ifndef _FWTRUST_RULE_FILE_HPP_
#define _FWTRUST_RULE_FILE_HPP_

#include <istream>
#include <string>
#include <vector>

#include "compiler.hpp"

namespace fwtrust { // begin namespace fwtrust

/*
 * INI rule files: one section per rule, the section name is the rule
 * name. the [global] section belongs to Config and is skipped.
 *
 *   [allow_ssh]
 *   protocol = tcp
 *   ports = 22
 *   trusted_nets = 10.0.0.0/8, 192.168.1.10
 */
extern bool read_rules(std::istream& input, std::vector<RuleParams>& rules,
                       std::string& err);
extern bool load_rules(const std::string& file,
                       std::vector<RuleParams>& rules, std::string& err);

} // end namespace fwtrust

#endif /* _FWTRUST_RULE_FILE_HPP_ */
