#ifndef _FWTRUST_TRUST_CONFIG_HPP_
#define _FWTRUST_TRUST_CONFIG_HPP_

#include <string>

#define FWTRUST_DEFAULT_CONFIG "/etc/fwtrust/fwtrust.conf"

namespace fwtrust { // begin namespace fwtrust

/*
 * process-wide settings. passed explicitly to the compiler and the
 * firewall-cmd backend.
 */
class Config
{
public:
  Config();

  /*
   * read the [global] section of an INI file. keys that are not present
   * keep their current value.
   */
  bool load(const std::string& file, std::string& err);

  bool enabled() const { return _enabled; }
  bool debug() const { return _debug; }
  const std::string& prefix() const { return _prefix; }
  const std::string& zone() const { return _zone; }
  const std::string& firewall_cmd() const { return _firewall_cmd; }

  void set_enabled(bool enabled) { _enabled = enabled; }
  void set_debug(bool debug) { _debug = debug; }
  void set_prefix(const std::string& prefix) { _prefix = prefix; }
  void set_zone(const std::string& zone) { _zone = zone; }
  void set_firewall_cmd(const std::string& cmd) { _firewall_cmd = cmd; }

private:
  bool        _enabled;
  bool        _debug;
  std::string _prefix;
  std::string _zone;
  std::string _firewall_cmd;
};

} // end namespace fwtrust

#endif /* _FWTRUST_TRUST_CONFIG_HPP_ */
