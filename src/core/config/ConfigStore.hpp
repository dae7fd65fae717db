#pragma once

#include "../stringio.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <gitversion/version.h>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "MutLink"

namespace config {

class ConfigStore
{
public:
  int threads;
  /** true if the user asked for --help or --version (nothing else to do) */
  bool is_info_request;

  ConfigStore();
  /** Parse command line arguments (and config file, if given).
   * @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  /** Print effective settings to stderr. */
  void printSettings() const;
  template<typename T>
    T getValue(const char* key) const;
  template<typename T>
    T getValue(const std::string key) const;

private:
  YAML::Node _config;
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::getValue(const char* key) const {
  const YAML::Node node = _config[key];
  if (!node) {
    fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key);
    return T();
  }
  return node.as<T>();
}

template<typename T>
T
ConfigStore::getValue(const std::string key) const {
  return getValue<T>(key.c_str());
}

} /* namespace config */
