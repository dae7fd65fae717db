#include <boost/test/unit_test.hpp>

#include "../core/config/ConfigStore.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
namespace fs = boost::filesystem;

struct FixtureConfig {
  FixtureConfig() {
    BOOST_TEST_MESSAGE( "setup fixure" );
    data_dir = TEST_DATA_DIR;
    fn_positions = data_dir + "/positions.tsv";
    fn_alignments = data_dir + "/reads.sam";
    tmp_dir = fs::temp_directory_path() / fs::unique_path("mutlink-cfg-%%%%-%%%%");
    fs::create_directories(tmp_dir);
  }
  ~FixtureConfig() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
    boost::system::error_code ec;
    fs::remove_all(tmp_dir, ec);
  }

  /** Run parser on a command line (program name is added). */
  bool parse(ConfigStore& config, vector<string> args) {
    args.insert(args.begin(), "mutlink");
    vector<char*> argv;
    for (string& a : args) {
      argv.push_back(&a[0]);
    }
    argv.push_back(nullptr);
    return config.parseArgs(static_cast<int>(args.size()), argv.data());
  }

  string data_dir;
  string fn_positions;
  string fn_alignments;
  fs::path tmp_dir;
};

BOOST_FIXTURE_TEST_SUITE( config, FixtureConfig )

BOOST_AUTO_TEST_CASE( command_line )
{
  ConfigStore config;
  BOOST_REQUIRE( parse(config, { "-p", fn_positions, "-a", fn_alignments, "-o", "out.csv",
                                 "-t", "2", "-q", "20", "--include-secondary", "1", "-v", "0" }) );
  BOOST_CHECK( !config.is_info_request );
  BOOST_CHECK_EQUAL( config.threads, 2 );
  BOOST_CHECK_EQUAL( config.getValue<string>("positions"), fn_positions );
  BOOST_CHECK_EQUAL( config.getValue<string>("output"), "out.csv" );
  BOOST_CHECK_EQUAL( config.getValue<unsigned>("min-mapq"), 20u );
  BOOST_CHECK( config.getValue<bool>("include-secondary") );

  // defaults
  BOOST_CHECK_EQUAL( config.getValue<string>("layout"), "variable" );
  BOOST_CHECK_EQUAL( config.getValue<unsigned>("batch-size"), 10000u );
  BOOST_CHECK_EQUAL( config.getValue<unsigned>("min-base-qual"), 0u );
  BOOST_CHECK( !config.getValue<bool>("include-duplicates") );
  BOOST_CHECK( config.getValue<bool>("pattern-summary") );
}

/* command line takes precedence over config file; relative paths follow the config file */
BOOST_AUTO_TEST_CASE( config_file )
{
  fs::copy_file(fn_positions, tmp_dir / "pos.tsv");
  fs::path fn_config = tmp_dir / "config.yml";
  ofstream fs_config(fn_config.string().c_str());
  fs_config << "positions: pos.tsv\n"
            << "alignments: " << fn_alignments << "\n"
            << "output: linkage.csv\n"
            << "layout: superset\n"
            << "threads: 3\n"
            << "min-mapq: 30\n"
            << "pattern-summary: false\n"
            << "verbosity: 0\n";
  fs_config.close();

  ConfigStore config;
  BOOST_REQUIRE( parse(config, { "-c", fn_config.string(), "-t", "2" }) );
  BOOST_CHECK_EQUAL( config.threads, 2 );
  BOOST_CHECK_EQUAL( config.getValue<string>("positions"), (tmp_dir / "pos.tsv").string() );
  BOOST_CHECK_EQUAL( config.getValue<string>("alignments"), fn_alignments );
  BOOST_CHECK_EQUAL( config.getValue<string>("output"), (tmp_dir / "linkage.csv").string() );
  BOOST_CHECK_EQUAL( config.getValue<string>("layout"), "superset" );
  BOOST_CHECK_EQUAL( config.getValue<unsigned>("min-mapq"), 30u );
  BOOST_CHECK( !config.getValue<bool>("pattern-summary") );
  BOOST_CHECK_EQUAL( config.getValue<int>("verbosity"), 0 );

  ConfigStore config_threads;
  BOOST_REQUIRE( parse(config_threads, { "-c", fn_config.string() }) );
  BOOST_CHECK_EQUAL( config_threads.threads, 3 );

  // output given on the command line is used as written
  ConfigStore config_output;
  BOOST_REQUIRE( parse(config_output, { "-c", fn_config.string(), "-o", "run/out.csv" }) );
  BOOST_CHECK_EQUAL( config_output.getValue<string>("output"), "run/out.csv" );
}

BOOST_AUTO_TEST_CASE( invalid_arguments )
{
  ConfigStore config;
  BOOST_CHECK( !parse(config, { "-p", fn_positions, "-a", fn_alignments }) );
  BOOST_CHECK( !config.is_info_request );

  ConfigStore config_layout;
  BOOST_CHECK( !parse(config_layout, { "-p", fn_positions, "-a", fn_alignments, "-o", "out.csv", "-l", "wide" }) );
  ConfigStore config_threads;
  BOOST_CHECK( !parse(config_threads, { "-p", fn_positions, "-a", fn_alignments, "-o", "out.csv", "-t", "0" }) );
  ConfigStore config_batch;
  BOOST_CHECK( !parse(config_batch, { "-p", fn_positions, "-a", fn_alignments, "-o", "out.csv", "--batch-size", "0" }) );
  ConfigStore config_missing;
  BOOST_CHECK( !parse(config_missing, { "-p", data_dir + "/missing.tsv", "-a", fn_alignments, "-o", "out.csv" }) );
  ConfigStore config_unknown;
  BOOST_CHECK( !parse(config_unknown, { "--no-such-option" }) );
  ConfigStore config_file;
  BOOST_CHECK( !parse(config_file, { "-c", (tmp_dir / "missing.yml").string() }) );
}

BOOST_AUTO_TEST_CASE( info_request )
{
  ConfigStore config_help;
  BOOST_CHECK( !parse(config_help, { "--help" }) );
  BOOST_CHECK( config_help.is_info_request );

  ConfigStore config_version;
  BOOST_CHECK( !parse(config_version, { "--version" }) );
  BOOST_CHECK( config_version.is_info_request );
}

BOOST_AUTO_TEST_SUITE_END()
