#ifndef _FWTRUST_NAMING_HPP_
#define _FWTRUST_NAMING_HPP_

#include <string>
#include <vector>

#define FWTRUST_MAXNAMELEN 31
#define FWTRUST_MINRANDLEN 8
#define FWTRUST_MAXPREFIXLEN (FWTRUST_MAXNAMELEN - 1 - FWTRUST_MINRANDLEN)
#define FWTRUST_RULE_PREFIX "rule"

namespace fwtrust { // begin namespace fwtrust

extern std::string seeded_rand_string(size_t length, const std::string& seed);
extern std::string sanitize_identifier(const std::string& id);
extern std::string collapse_separators(const std::string& name);

/*
 * <prefix>_<random>, where the random part is seeded from the family,
 * the set kind and the sorted, de-duplicated trusted networks.
 * always FWTRUST_MAXNAMELEN long. the prefix is cut to
 * FWTRUST_MAXPREFIXLEN so at least FWTRUST_MINRANDLEN random characters
 * remain.
 */
extern std::string ipset_name(const std::string& prefix,
                              const std::string& family,
                              const std::string& kind,
                              const std::vector<std::string>& networks);
extern std::string rule_name(int order, const std::string& id,
                             const std::string& target);
extern std::string service_name(const std::string& prefix,
                                const std::string& id);

} // end namespace fwtrust

#endif /* _FWTRUST_NAMING_HPP_ */
