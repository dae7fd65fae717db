#include <boost/test/unit_test.hpp>

#include "../core/errors.hpp"
#include "../core/seqio.hpp"
#include "../core/stringio.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using namespace seqio;
using errors::ValidationError;

struct FixtureSeqio {
  FixtureSeqio() {
    BOOST_TEST_MESSAGE( "set up fixure" );
    fn_positions = string(TEST_DATA_DIR) + "/positions.tsv";
  }
  ~FixtureSeqio() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  /** Parse lines, return line/field of expected ValidationError. */
  pair<unsigned long, string> parseError(const string& content) {
    istringstream ss(content);
    BedFile bed;
    try {
      bed.parseBed(ss);
    } catch (const ValidationError& e) {
      BOOST_TEST_MESSAGE( "caught: " << e.what() );
      return make_pair(e.line, e.field);
    }
    BOOST_ERROR( "no ValidationError for input:\n" << content );
    return make_pair(0ul, string(""));
  }

  string fn_positions;
};

BOOST_FIXTURE_TEST_SUITE( seqio, FixtureSeqio )

BOOST_AUTO_TEST_CASE( bed_file )
{
  BedFile bed(fn_positions);
  BOOST_CHECK_EQUAL( bed.m_num_recs, 4u );

  vector<PositionRow> rows;
  bed.getPositionRows(rows);
  BOOST_REQUIRE_EQUAL( rows.size(), 4u );
  BOOST_CHECK_EQUAL( rows[0].seq_id, "chr1" );
  BOOST_CHECK_EQUAL( rows[0].start, 102ul );
  BOOST_CHECK_EQUAL( rows[0].end, 103ul );
  BOOST_CHECK_EQUAL( rows[0].label, "snv1" );
  BOOST_CHECK_EQUAL( rows[0].line, 3ul ); // two comment lines
  BOOST_CHECK_EQUAL( rows[1].wildtype, "GT" );
  BOOST_REQUIRE_EQUAL( rows[1].mutants.size(), 2u );
  BOOST_CHECK_EQUAL( rows[1].mutants[1], "ca" ); // case preserved by parser
  BOOST_CHECK_EQUAL( rows[3].seq_id, "chr2" );

  vector<Locus> loci;
  bed.getLoci(loci);
  BOOST_REQUIRE_EQUAL( loci.size(), 4u );
  BOOST_CHECK_EQUAL( loci[1].length(), 2ul );
}

BOOST_AUTO_TEST_CASE( bed_comments )
{
  istringstream ss(
    "track name=poi\n"
    "\n"
    "# comment\n"
    "chr1\t5\t6\tp1\tA\tC\r\n"
    "chr1\t7\t8\tp2\tA\tC\tG"
  );
  BedFile bed;
  bed.parseBed(ss);
  BOOST_CHECK_EQUAL( bed.m_num_recs, 2u );
  BOOST_CHECK_EQUAL( bed.m_vec_line[0], 4ul );
  BOOST_CHECK_EQUAL( bed.m_vec_line[1], 5ul );
  BOOST_CHECK_EQUAL( bed.m_vec_mut[1].size(), 2u );
  BOOST_CHECK_EQUAL( bed.m_vec_mut[0][0], "C" );

  // reference names starting with a header keyword are data
  istringstream ss_names(
    "browser position chr1:1-100\n"
    "track\n"
    "tracker_plasmid\t10\t11\tsnv\tA\tG\n"
    "browser2\t5\t6\tx\tC\tT\n"
    "chr1\t1\t2\ty\tA\tT\n"
  );
  BedFile bed_names;
  bed_names.parseBed(ss_names);
  BOOST_REQUIRE_EQUAL( bed_names.m_num_recs, 3u );
  BOOST_CHECK_EQUAL( bed_names.m_vec_seqid[0], "tracker_plasmid" );
  BOOST_CHECK_EQUAL( bed_names.m_vec_seqid[1], "browser2" );
  BOOST_CHECK_EQUAL( bed_names.m_vec_line[0], 3ul );
}

BOOST_AUTO_TEST_CASE( bed_malformed )
{
  pair<unsigned long, string> err;

  err = parseError("#hdr\nchr1\t5\t6\tp1\tA\n");
  BOOST_CHECK_EQUAL( err.first, 2ul );
  BOOST_CHECK_EQUAL( err.second, "mutant_allele_1" );

  err = parseError("chr1\t5\n");
  BOOST_CHECK_EQUAL( err.first, 1ul );
  BOOST_CHECK_EQUAL( err.second, "end" );

  err = parseError("chr1\t5\t6\tp1\tA\tC\nchr1\t-5\t6\tp2\tA\tC\n");
  BOOST_CHECK_EQUAL( err.first, 2ul );
  BOOST_CHECK_EQUAL( err.second, "start" );

  err = parseError("chr1\t5\t6x\tp1\tA\tC\n");
  BOOST_CHECK_EQUAL( err.second, "end" );

  err = parseError("chr1\t5\t6\t\tA\tC\n");
  BOOST_CHECK_EQUAL( err.second, "label" );

  BOOST_CHECK_THROW( BedFile("does/not/exist.tsv"), ValidationError );
}

BOOST_AUTO_TEST_CASE( locus )
{
  Locus a("chr1", 10, 20);
  Locus b("chr1", 19, 25);
  Locus c("chr1", 20, 25);
  Locus d("chr2", 10, 20);
  BOOST_CHECK( a.overlaps(b) );
  BOOST_CHECK( b.overlaps(a) );
  BOOST_CHECK( !a.overlaps(c) );
  BOOST_CHECK( !a.overlaps(d) );
  BOOST_CHECK_EQUAL( a.length(), 10ul );
  BOOST_CHECK( a.region() == make_tuple(string("chr1"), 10ul, 20ul) );
}

BOOST_AUTO_TEST_CASE( strings )
{
  vector<string> f = stringio::split("a\t\tb\t", '\t');
  BOOST_REQUIRE_EQUAL( f.size(), 4u );
  BOOST_CHECK_EQUAL( f[1], "" );
  BOOST_CHECK_EQUAL( f[3], "" );
  BOOST_CHECK_EQUAL( stringio::toUpper("acGt"), "ACGT" );
  BOOST_CHECK_EQUAL( stringio::trim("  x y \t"), "x y" );
  unsigned long v = 0;
  BOOST_CHECK( stringio::parseUlong("12345", v) );
  BOOST_CHECK_EQUAL( v, 12345ul );
  BOOST_CHECK( !stringio::parseUlong("", v) );
  BOOST_CHECK( !stringio::parseUlong("1e5", v) );
  BOOST_CHECK( !stringio::parseUlong("99999999999999999999999", v) );
  BOOST_CHECK_EQUAL( stringio::csvCell("plain"), "plain" );
  BOOST_CHECK_EQUAL( stringio::csvCell("a,b"), "\"a,b\"" );
  BOOST_CHECK_EQUAL( stringio::csvCell("say \"hi\""), "\"say \"\"hi\"\"\"" );
  BOOST_CHECK_EQUAL( stringio::join({"a", "b", "c"}, "|"), "a|b|c" );
}

BOOST_AUTO_TEST_SUITE_END()
