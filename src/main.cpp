/**
 * Per-read allele calls at multiple positions of interest, to detect
 * mutations linked on the same sequencing read.
 */
#include "core/bamio.hpp"
#include "core/config/ConfigStore.hpp"
#include "core/errors.hpp"
#include "core/seqio/BedFile.hpp"
#include "core/vario/PositionTable.hpp"

#include <boost/filesystem.hpp>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <omp.h>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
using errors::DecodeError;
using errors::IoError;
using errors::ValidationError;
using seqio::BedFile;
using seqio::PositionRow;
using vario::PositionTable;

// exit codes by error category
const int EXIT_USAGE      = 1;
const int EXIT_VALIDATION = 2;
const int EXIT_IO         = 3;
const int EXIT_DECODE     = 4;

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return config.is_info_request ? EXIT_SUCCESS : EXIT_USAGE; }

  string fn_positions = config.getValue<string>("positions");
  string fn_alignments = config.getValue<string>("alignments");
  boost::filesystem::path fn_output(config.getValue<string>("output"));
  string str_layout = config.getValue<string>("layout");
  bool do_summary = config.getValue<bool>("pattern-summary");
  int verbosity = config.getValue<int>("verbosity");

  bamio::ScanOptions scan_opts;
  scan_opts.threads = config.threads;
  scan_opts.batch_size = config.getValue<unsigned>("batch-size");
  scan_opts.min_mapq = config.getValue<unsigned>("min-mapq");
  scan_opts.min_base_qual = config.getValue<unsigned>("min-base-qual");
  scan_opts.include_secondary = config.getValue<bool>("include-secondary");
  scan_opts.include_duplicates = config.getValue<bool>("include-duplicates");
  scan_opts.verbosity = verbosity;

  bamio::OutputLayout layout = bamio::LAYOUT_VARIABLE;
  bamio::parseLayout(str_layout, layout);

  // set number of parallel threads
  omp_set_num_threads(config.threads);

  // load positions of interest (nothing is written if this fails)
  PositionTable table;
  try {
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] (main) Reading positions of interest from '%s'...\n", fn_positions.c_str());
    }
    BedFile bed(fn_positions);
    vector<PositionRow> rows;
    bed.getPositionRows(rows);
    table = PositionTable::build(rows);
  } catch (const ValidationError& e) {
    fprintf(stderr, "[ERROR] (main) Invalid positions file '%s': %s\n", fn_positions.c_str(), e.what());
    return EXIT_VALIDATION;
  }
  if (verbosity > 0) {
    fprintf(stderr, "[INFO] (main) Loaded %zu positions on %zu reference sequences.\n",
            table.size(), table.referenceNames().size());
  }
  if (table.size() == 0) {
    fprintf(stderr, "[WARN] (main) No positions of interest; output will contain no rows.\n");
  }

  bamio::LinkageWriter writer(fn_output, table, layout, do_summary);
  bamio::ScanStats stats;
  try {
    bamio::AlignmentReader reader(fn_alignments);
    writer.open(version::GIT_TAG_NAME);
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] (main) Scanning alignments in '%s' (%d threads)...\n",
              fn_alignments.c_str(), config.threads);
    }
    bamio::LinkageScanner scanner(table, scan_opts);
    stats = scanner.scan(reader, writer);
    writer.close();
  } catch (const DecodeError& e) {
    writer.abandon();
    fprintf(stderr, "[ERROR] (main) Could not decode alignments: %s\n", e.what());
    if (writer.hasPartial()) {
      fprintf(stderr, "[ERROR] (main) Output is INCOMPLETE, %lu rows left in '%s'.\n",
              writer.numRows(), writer.partialPath().string().c_str());
    } else {
      fprintf(stderr, "[ERROR] (main) No output written.\n");
    }
    return EXIT_DECODE;
  } catch (const IoError& e) {
    writer.abandon();
    fprintf(stderr, "[ERROR] (main) Could not write output: %s\n", e.what());
    if (writer.hasPartial()) {
      fprintf(stderr, "[ERROR] (main) Output is INCOMPLETE: '%s'.\n", writer.partialPath().string().c_str());
    }
    return EXIT_IO;
  }

  if (stats.num_anomalies > 0) {
    fprintf(stderr, "[WARN] (main) Skipped %lu reads with inconsistent CIGAR operations.\n", stats.num_anomalies);
  }
  if (verbosity > 0) {
    fprintf(stderr, "--------------------------------------------------------------------------------\n");
    fprintf(stderr, "Summary:\n");
    fprintf(stderr, "--------------------------------------------------------------------------------\n");
    fprintf(stderr, "%s", stats.to_string().c_str());
    fprintf(stderr, "  rows written:\t\t%lu\n", writer.numRows());
    fprintf(stderr, "  output:\t\t%s\n", writer.finalPath().string().c_str());
    if (do_summary) {
      fprintf(stderr, "  pattern summary:\t%s\n", writer.summaryPath().string().c_str());
    }
  }

  return EXIT_SUCCESS;
}
