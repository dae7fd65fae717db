#include "ConfigStore.hpp"
#include "../bamio/LinkageWriter.hpp"

using namespace std;
namespace fs = boost::filesystem;

namespace config {

// default constructor
ConfigStore::ConfigStore()
: threads(1), is_info_request(false)
{
  _config = YAML::Node();
}

bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  string fn_config = "";
  string fn_positions = "";
  string fn_alignments = "";
  string fn_output = "";
  string layout = "variable";
  unsigned batch_size = 10000;
  unsigned min_mapq = 0;
  unsigned min_base_qual = 0;
  bool include_secondary = false;
  bool include_duplicates = false;
  bool pattern_summary = true;
  int verb = 1;

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl << endl;
  ss << "Reports per-read allele calls at linked positions of interest." << endl << endl;
  ss << "Usage: mutlink -p positions.tsv -a reads.bam -o linkage.csv" << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(), "config file (YAML)")
    ("positions,p", po::value<string>(&fn_positions), "positions of interest (tab-separated)")
    ("alignments,a", po::value<string>(&fn_alignments), "aligned reads (SAM/BAM)")
    ("output,o", po::value<string>(&fn_output), "output file (CSV)")
    ("layout,l", po::value<string>(&layout), "output columns: 'variable' (per read) or 'superset' (all positions)")
    ("threads,t", po::value<int>(&threads), "number of parallel threads")
    ("batch-size", po::value<unsigned>(&batch_size), "records dispatched to threads at once")
    ("min-mapq,q", po::value<unsigned>(&min_mapq), "minimum mapping quality of a read")
    ("min-base-qual,b", po::value<unsigned>(&min_base_qual), "minimum base quality within a position (0: disabled)")
    ("include-secondary", po::value<bool>(&include_secondary), "score secondary/supplementary alignments")
    ("include-duplicates", po::value<bool>(&include_duplicates), "score duplicate/QC-fail reads")
    ("pattern-summary", po::value<bool>(&pattern_summary), "write read counts per pattern")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output")
  ;

  po::variables_map var_map;

  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl;
      is_info_request = true;
      return false;
    }

    if (var_map.count("help") || ac == 1) {
      std::cerr << desc << std::endl;
      is_info_request = true;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (std::exception &e) {
    fprintf(stderr, "\nArgumentError: %s\n", e.what());
    std::cerr << desc << std::endl;
    return false;
  }

  // check: config file exists
  if (var_map.count("config")) {
    fn_config = var_map["config"].as<string>();
    if (!fileExists(fn_config)) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      return false;
    }
    // initialize global configuration from config file
    try {
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Could not parse config file '%s': %s\n", fn_config.c_str(), e.what());
      return false;
    }
  }

  // Manage paths / filenames
  //---------------------------------------------------------------------------

  // get config file's absolute directory
  fs::path path_conf( fs::current_path() );
  if ( fn_config.length() > 0 ) { // find files relative to config directory
    path_conf = fs::absolute( fs::path( fn_config ) ).parent_path();
  }

  // overwrite/set config params
  // (command line > config file > defaults)
  try {
    // path to positions of interest
    if (var_map.count("positions") || !_config["positions"]) {
      _config["positions"] = fn_positions;
    } else {
      fs::path p( _config["positions"].as<string>() );
      _config["positions"] = (p.is_relative() ? (path_conf / p).string() : p.string());
    }
    fn_positions = _config["positions"].as<string>();
    // path to alignments
    if (var_map.count("alignments") || !_config["alignments"]) {
      _config["alignments"] = fn_alignments;
    } else {
      fs::path p( _config["alignments"].as<string>() );
      _config["alignments"] = (p.is_relative() ? (path_conf / p).string() : p.string());
    }
    fn_alignments = _config["alignments"].as<string>();
    // path to output file
    if (var_map.count("output") || !_config["output"]) {
      _config["output"] = fn_output;
    } else {
      fs::path p( _config["output"].as<string>() );
      _config["output"] = (p.is_relative() ? (path_conf / p).string() : p.string());
    }
    fn_output = _config["output"].as<string>();
    // output column layout
    if (var_map.count("layout") || !_config["layout"]) {
      _config["layout"] = layout;
    }
    layout = _config["layout"].as<string>();
    // number of parallel threads
    if (var_map.count("threads") || !_config["threads"]) {
      _config["threads"] = threads;
    }
    threads = _config["threads"].as<int>();
    // records per batch
    if (var_map.count("batch-size") || !_config["batch-size"]) {
      _config["batch-size"] = batch_size;
    }
    batch_size = _config["batch-size"].as<unsigned>();
    // read filters
    if (var_map.count("min-mapq") || !_config["min-mapq"]) {
      _config["min-mapq"] = min_mapq;
    }
    min_mapq = _config["min-mapq"].as<unsigned>();
    if (var_map.count("min-base-qual") || !_config["min-base-qual"]) {
      _config["min-base-qual"] = min_base_qual;
    }
    min_base_qual = _config["min-base-qual"].as<unsigned>();
    if (var_map.count("include-secondary") || !_config["include-secondary"]) {
      _config["include-secondary"] = include_secondary;
    }
    include_secondary = _config["include-secondary"].as<bool>();
    if (var_map.count("include-duplicates") || !_config["include-duplicates"]) {
      _config["include-duplicates"] = include_duplicates;
    }
    include_duplicates = _config["include-duplicates"].as<bool>();
    // pattern summary output
    if (var_map.count("pattern-summary") || !_config["pattern-summary"]) {
      _config["pattern-summary"] = pattern_summary;
    }
    pattern_summary = _config["pattern-summary"].as<bool>();
    // how chatty should status messages be?
    if (var_map.count("verbosity") || !_config["verbosity"]) {
      _config["verbosity"] = verb;
    }
    verb = _config["verbosity"].as<int>();
  } catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid value in config file '%s': %s\n", fn_config.c_str(), e.what());
    return false;
  }

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  if (fn_positions.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'positions' is required.\n");
    return false;
  }
  if (fn_alignments.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'alignments' is required.\n");
    return false;
  }
  if (fn_output.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'output' is required.\n");
    return false;
  }
  if (!fileExists(fn_positions)) {
    fprintf(stderr, "\nArgumentError: Positions file '%s' does not exist.\n", fn_positions.c_str());
    return false;
  }
  if (!fileExists(fn_alignments)) {
    fprintf(stderr, "\nArgumentError: Alignment file '%s' does not exist.\n", fn_alignments.c_str());
    return false;
  }
  bamio::OutputLayout out_layout;
  if (!bamio::parseLayout(layout, out_layout)) {
    fprintf(stderr, "\nArgumentError: Unknown layout '%s' (expected 'variable' or 'superset').\n", layout.c_str());
    return false;
  }
  if (threads < 1) {
    fprintf(stderr, "\nArgumentError: Number of threads must be >= 1 (got %d).\n", threads);
    return false;
  }
  if (batch_size < 1) {
    fprintf(stderr, "\nArgumentError: Batch size must be >= 1.\n");
    return false;
  }

  if (verb > 0) {
    this->printSettings();
  }

  return true;
}

void ConfigStore::printSettings() const {
  fprintf(stderr, "################################################################################\n");
  fprintf(stderr, "%s (%s)\n", PROGRAM_NAME, version::GIT_TAG_NAME);
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "Running with the following options:\n");
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "  positions:\t\t%s\n", _config["positions"].as<string>().c_str());
  fprintf(stderr, "  alignments:\t\t%s\n", _config["alignments"].as<string>().c_str());
  fprintf(stderr, "  output:\t\t%s\n", _config["output"].as<string>().c_str());
  fprintf(stderr, "  layout:\t\t%s\n", _config["layout"].as<string>().c_str());
  fprintf(stderr, "  pattern summary:\t%s\n", _config["pattern-summary"].as<bool>() ? "yes" : "no");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "Read filters:\n");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  min mapping quality:\t%u\n", _config["min-mapq"].as<unsigned>());
  fprintf(stderr, "  min base quality:\t%u\n", _config["min-base-qual"].as<unsigned>());
  fprintf(stderr, "  secondary alignments:\t%s\n", _config["include-secondary"].as<bool>() ? "include" : "skip");
  fprintf(stderr, "  duplicates/QC-fail:\t%s\n", _config["include-duplicates"].as<bool>() ? "include" : "skip");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  threads:\t\t%d\n", _config["threads"].as<int>());
  fprintf(stderr, "  batch size:\t\t%u\n", _config["batch-size"].as<unsigned>());
  fprintf(stderr, "################################################################################\n");
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */
