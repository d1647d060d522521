#include <fstream>
#include <exception>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include "trust_config.hpp"
#include "../util.hpp"

using namespace std;
using namespace boost::property_tree;

fwtrust::Config::Config() :
  _enabled(true),
  _debug(false),
  _prefix("trust"),
  _zone("99_trusted"),
  _firewall_cmd("firewall-cmd")
{
}

bool
fwtrust::Config::load(const string& file, string& err)
{
  ptree pt;

  ifstream input(file.c_str());
  if (!input.is_open()) {
    err = "unable to open config file [" + file + "]";
    return false;
  }

  try {
    read_ini(input, pt);
    _enabled = pt.get<bool>("global.enabled", _enabled);
    _debug = pt.get<bool>("global.debug", _debug);
    _prefix = boost::trim_copy(pt.get<string>("global.prefix", _prefix));
    _zone = boost::trim_copy(pt.get<string>("global.zone", _zone));
    _firewall_cmd = boost::trim_copy(pt.get<string>("global.firewall_cmd",
                                                    _firewall_cmd));
  }
  catch (exception& e) {
    err = file + ": " + e.what();
    return false;
  }

  if (_zone.empty()) {
    err = file + ": zone must not be empty";
    return false;
  }
  log_msg("config %s: enabled %d prefix [%s] zone [%s]", file.c_str(),
          _enabled, _prefix.c_str(), _zone.c_str());
  return true;
}
