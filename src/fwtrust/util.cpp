#include <stdio.h>
#include <stdarg.h>
#include <regex.h>
#include <iostream>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "util.hpp"

bool debug_flag = false;

using namespace std;

void
log_msg(const char *format, ...)
{
    va_list ap;

    if (!debug_flag)
        return;

    va_start(ap, format);
    vprintf(format, ap);
    va_end(ap);
    printf("\n");
}

namespace fwtrust { // begin namespace fwtrust

bool
parse_number(const string& s, int& value)
{
    if (s.empty() || s.length() > 9 || !boost::all(s, boost::is_digit()))
        return false;

    try {
        value = boost::lexical_cast<int>(s);
    }
    catch (boost::bad_lexical_cast&) {
        return false;
    }
    return true;
}

bool
is_valid_port_number(const string& number, int& port, string& err)
{
    if (!parse_number(number, port) || port < 1 || port > 65535) {
        err  = "invalid port '";
        err += number + "' (must be between 1 and 65535)";
        return false;
    }
    return true;
}

bool
is_valid_port_range(const string& range_s, const string& range_e,
                    int& start, int& stop, string& err)
{
    if (!is_valid_port_number(range_s, start, err)
        || !is_valid_port_number(range_e, stop, err))
        return false;

    if (stop <= start) {
        err  = "invalid port range (";
        err += range_e + " is not greater than " + range_s + ")";
        return false;
    }
    return true;
}

/*
 * "N-M" or the iptables style "N:M".
 */
bool
is_port_range(const string& s, string& start, string& stop)
{
    static regex_t range_regex;
    static bool compiled = false;
    regmatch_t match[3];
    int rc;

    if (!compiled) {
        rc = regcomp(&range_regex, "^([0-9]+)[-:]([0-9]+)$", REG_EXTENDED);
        if (rc != 0) {
            cerr << "regcomp() failed (" << rc << ")" << endl;
            return false;
        }
        compiled = true;
    }

    if (regexec(&range_regex, s.c_str(), 3, match, 0) != 0)
        return false;

    start.assign(s, match[1].rm_so, match[1].rm_eo - match[1].rm_so);
    stop.assign(s, match[2].rm_so, match[2].rm_eo - match[2].rm_so);
    return true;
}

string
my_itoa(int i)
{
    return boost::lexical_cast<string>(i);
}

/*
 * split a comma and/or whitespace separated list, dropping empty tokens.
 */
void
split_list(const string& s, vector<string>& v)
{
    vector<string> tokens;
    vector<string>::iterator it;

    boost::split(tokens, s, boost::is_any_of(", \t\n"),
                 boost::token_compress_on);
    for (it = tokens.begin(); it != tokens.end(); it++) {
        boost::trim(*it);
        if (!it->empty())
            v.push_back(*it);
    }
}

string
join(const vector<string>& v, const string& sep)
{
    return boost::algorithm::join(v, sep);
}

} // end namespace fwtrust
