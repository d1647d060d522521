#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>
#include <unistd.h>

#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

#include "backend.hpp"
#include "compiler.hpp"
#include "rule_file.hpp"
#include "lib/trust_config.hpp"
#include "util.hpp"

using namespace std;
using namespace fwtrust;

enum {
  CONFIG = 1,
  RULES,
  NAME,
  PROTOCOL,
  PORT,
  ICMP_BLOCK,
  TRUSTED,
  ORDER,
  APPLY_TO,
  PREFIX,
  ZONE,
  DEBUG,
  HELP,
};

static struct option long_options[] = {
  { "config",       required_argument,  0,  CONFIG },
  { "rules",        required_argument,  0,  RULES },
  { "name",         required_argument,  0,  NAME },
  { "protocol",     required_argument,  0,  PROTOCOL },
  { "port",         required_argument,  0,  PORT },
  { "icmp-block",   required_argument,  0,  ICMP_BLOCK },
  { "trusted",      required_argument,  0,  TRUSTED },
  { "order",        required_argument,  0,  ORDER },
  { "apply-to",     required_argument,  0,  APPLY_TO },
  { "prefix",       required_argument,  0,  PREFIX },
  { "zone",         required_argument,  0,  ZONE },
  { "debug",        no_argument,        0,  DEBUG },
  { "help",         no_argument,        0,  HELP },
  { 0,              0,                  0,  0 }
};

static void
usage(FILE *out)
{
  fprintf(out,
          "usage: fwtrust [options] compile|script|apply|names\n"
          "  --config <file>      global settings (default "
          FWTRUST_DEFAULT_CONFIG ")\n"
          "  --rules <file>       INI file with one section per rule\n"
          "  --name <id>          rule name\n"
          "  --protocol <proto>   tcp, udp, icmp, ah, esp or all\n"
          "  --port <port>        port, range or list (repeatable)\n"
          "  --icmp-block <type>  icmp type to block (repeatable)\n"
          "  --trusted <net>      trusted address or network (repeatable)\n"
          "  --order <n>          rule order (default %d)\n"
          "  --apply-to <family>  ipv4, ipv6, all or auto\n"
          "  --prefix <prefix>    naming prefix\n"
          "  --zone <zone>        target zone\n"
          "  --debug              debug output\n",
          FWTRUST_DEFAULT_ORDER);
}

static void
print_names(const Plan& plan)
{
  vector<Plan::Ref> refs;
  string err;

  if (!plan.ordered(refs, err)) {
    cerr << "Error: " << err << endl;
    exit(EXIT_FAILURE);
  }
  BOOST_FOREACH(const Plan::Ref& ref, refs) {
    cout << Plan::type_string(ref.type) << " " << ref.name << endl;
  }
}

/**
 * @brief The main function fwtrust application.
 * @param[in] argc Arguments count.
 * @param[in] argv Arguments array.
 * @return Exit status of the application.
 */
int main(int argc, char **argv)
{
  int opt = 0, index;
  string config_file, rules_file, err;
  bool have_rule = false;
  RuleParams cli_rule;
  Config config;

  while ((opt = getopt_long_only(argc, argv, "",
                                 long_options, &index)) != -1) {
    switch (opt) {
      case CONFIG:
        config_file = optarg;
        break;
      case RULES:
        rules_file = optarg;
        break;
      case NAME:
        cli_rule.name = optarg;
        have_rule = true;
        break;
      case PROTOCOL:
        cli_rule.protocol = optarg;
        break;
      case PORT:
        cli_rule.ports.push_back(optarg);
        break;
      case ICMP_BLOCK:
        cli_rule.icmp_blocks.push_back(optarg);
        break;
      case TRUSTED:
        cli_rule.trusted_nets.push_back(optarg);
        break;
      case ORDER:
        try {
          cli_rule.order = boost::lexical_cast<int>(optarg);
        }
        catch (boost::bad_lexical_cast&) {
          cerr << "Error: invalid order '" << optarg << "'" << endl;
          exit(EXIT_FAILURE);
        }
        break;
      case APPLY_TO:
        cli_rule.apply_to = optarg;
        break;
      case PREFIX:
        cli_rule.prefix = optarg;
        break;
      case ZONE:
        cli_rule.zone = optarg;
        break;
      case DEBUG:
        debug_flag = true;
        break;
      case HELP:
        usage(stdout);
        exit(EXIT_SUCCESS);
      default:
        usage(stderr);
        exit(EXIT_FAILURE);
    }
  }

  if (optind != argc - 1) {
    cerr << "Error: missing command" << endl;
    usage(stderr);
    exit(EXIT_FAILURE);
  }
  string op(argv[optind]);
  if (op != "compile" && op != "script" && op != "apply" && op != "names") {
    cerr << "Error: Invalid command [" << op << "]" << endl;
    exit(EXIT_FAILURE);
  }

  // the default config file is optional, an explicit one is not
  if (config_file.empty() && access(FWTRUST_DEFAULT_CONFIG, F_OK) == 0)
    config_file = FWTRUST_DEFAULT_CONFIG;
  if (!config_file.empty() && !config.load(config_file, err)) {
    cerr << "Error: " << err << endl;
    exit(EXIT_FAILURE);
  }
  if (config.debug())
    debug_flag = true;

  vector<RuleParams> rules;
  if (!rules_file.empty() && !load_rules(rules_file, rules, err)) {
    cerr << "Error: " << err << endl;
    exit(EXIT_FAILURE);
  }
  if (have_rule)
    rules.push_back(cli_rule);
  if (rules.empty()) {
    cerr << "Error: no rules given (use --name or --rules)" << endl;
    exit(EXIT_FAILURE);
  }

  Compiler compiler(config);
  Plan plan;
  if (!compiler.compile(rules, plan, err)) {
    cerr << "Error: " << err << endl;
    exit(EXIT_FAILURE);
  }
  BOOST_FOREACH(const string& warning, plan.get_warnings()) {
    cerr << "Warning: " << warning << endl;
  }

  if (op == "compile") {
    plan.print();
  } else if (op == "names") {
    print_names(plan);
  } else {
    FirewallCmd backend(config.firewall_cmd(),
                        op == "script" ? &cout : NULL);
    if (!apply_plan(plan, backend, err)) {
      cerr << "Error: " << err << endl;
      exit(EXIT_FAILURE);
    }
  }
  return 0;
}
