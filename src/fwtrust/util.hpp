#ifndef _FWTRUST_UTIL_HPP_
#define _FWTRUST_UTIL_HPP_

#include <string>
#include <vector>

extern bool debug_flag;

extern void log_msg(const char *format, ...);

namespace fwtrust { // begin namespace fwtrust

/*
 * decimal digits only, no sign. leading zeros are accepted.
 */
extern bool parse_number(const std::string& s, int& value);

extern bool is_valid_port_number(const std::string& number, int& port,
                                 std::string& err);
extern bool is_valid_port_range(const std::string& range_s,
                                const std::string& range_e,
                                int& start, int& stop, std::string& err);
extern bool is_port_range(const std::string& s, std::string& start,
                          std::string& stop);

extern std::string my_itoa(int i);
extern void split_list(const std::string& s, std::vector<std::string>& v);
extern std::string join(const std::vector<std::string>& v,
                        const std::string& sep);

} // end namespace fwtrust

#endif /* _FWTRUST_UTIL_HPP_ */
