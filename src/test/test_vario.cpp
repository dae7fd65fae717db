#include <boost/test/unit_test.hpp>

#include "../core/errors.hpp"
#include "../core/seqio.hpp"
#include "../core/vario.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace std;
using namespace vario;
using errors::ValidationError;
using seqio::PositionRow;
using seqio::TCoord;

/** Build a positions-file row. */
PositionRow makeRow(string chr, TCoord start, TCoord end, string label,
                    string wt, vector<string> mut, unsigned long line=1) {
  PositionRow r;
  r.line = line;
  r.seq_id = chr;
  r.start = start;
  r.end = end;
  r.label = label;
  r.wildtype = wt;
  r.mutants = mut;
  return r;
}

struct FixtureVario {
  FixtureVario() {
    BOOST_TEST_MESSAGE( "setup fixure" );
    // deliberately unsorted input
    rows.push_back(makeRow("chr2", 50, 51, "c2_50", "A", {"T"}, 1));
    rows.push_back(makeRow("chr1", 300, 302, "c1_300", "AC", {"GT", "aa"}, 2));
    rows.push_back(makeRow("chr1", 120, 121, "c1_120", "a", {"G"}, 3));
    rows.push_back(makeRow("chr1", 10, 11, "c1_10", "C", {"T"}, 4));
    rows.push_back(makeRow("chr1", 200, 203, "c1_200", "ACG", {"TTT"}, 5));
  }
  ~FixtureVario() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  /** Labels of positions overlapping a query. */
  vector<string> query(const PositionTable& table, string chr, TCoord start, TCoord end) {
    vector<const PositionOfInterest*> vec_pos;
    table.overlapping(chr, start, end, vec_pos);
    vector<string> labels;
    for (auto p : vec_pos) labels.push_back(p->label);
    return labels;
  }

  /** Field name reported when building a table from a single row. */
  string rejectedField(const PositionRow& row) {
    try {
      PositionTable::build(vector<PositionRow>(1, row));
    } catch (const ValidationError& e) {
      BOOST_CHECK_EQUAL( e.line, row.line );
      return e.field;
    }
    BOOST_ERROR( "row accepted: " << row.label );
    return "";
  }

  vector<PositionRow> rows;
};

BOOST_FIXTURE_TEST_SUITE( vario, FixtureVario )

BOOST_AUTO_TEST_CASE( table_build )
{
  PositionTable table = PositionTable::build(rows);
  BOOST_CHECK_EQUAL( table.size(), 5u );
  BOOST_CHECK( table.hasReference("chr1") );
  BOOST_CHECK( !table.hasReference("chr3") );
  vector<string> names = table.referenceNames();
  BOOST_REQUIRE_EQUAL( names.size(), 2u );
  BOOST_CHECK_EQUAL( names[0], "chr1" );

  // table order: reference name, then start
  const vector<PositionOfInterest>& vec_pos = table.positions();
  BOOST_CHECK_EQUAL( vec_pos[0].label, "c1_10" );
  BOOST_CHECK_EQUAL( vec_pos[1].label, "c1_120" );
  BOOST_CHECK_EQUAL( vec_pos[3].label, "c1_300" );
  BOOST_CHECK_EQUAL( vec_pos[4].label, "c2_50" );
  for (unsigned i=0; i<vec_pos.size(); i++) {
    BOOST_CHECK_EQUAL( vec_pos[i].idx, i );
  }
  // alleles are stored upper case
  BOOST_CHECK_EQUAL( vec_pos[1].wildtype, "A" );
  BOOST_CHECK_EQUAL( vec_pos[3].mutants[1], "AA" );
  BOOST_CHECK_EQUAL( vec_pos[3].line, 2ul );
  BOOST_CHECK_EQUAL( vec_pos[2].length(), 3ul );
  BOOST_CHECK( vec_pos[2].locus().overlaps(seqio::Locus("chr1", 202, 210)) );
  BOOST_CHECK( !vec_pos[2].locus().overlaps(seqio::Locus("chr2", 202, 210)) );
}

BOOST_AUTO_TEST_CASE( table_validation )
{
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 10, "empty", "A", {"C"}, 7)), "end" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 9, "reverse", "A", {"C"}, 8)), "end" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 12, "short_wt", "A", {"CC"})), "wildtype_allele" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 12, "long_mut", "AA", {"CC", "GGG"})), "mutant_allele_2" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 11, "dup", "A", {"a"})), "mutant_allele_1" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 11, "dup_mut", "A", {"C", "G", "c"})), "mutant_allele_3" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 11, "bad_base", "A", {"X"})), "mutant_allele_1" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 11, "no_mut", "A", {})), "mutant_allele_1" );
  BOOST_CHECK_EQUAL( rejectedField(makeRow("chr1", 10, 11, "empty_mut", "A", {""})), "mutant_allele_1" );

  // a single bad row rejects the whole table
  rows.push_back(makeRow("chr1", 5, 4, "bad", "A", {"C"}, 9));
  BOOST_CHECK_THROW( PositionTable::build(rows), ValidationError );
}

BOOST_AUTO_TEST_CASE( table_overlap )
{
  PositionTable table(rows);

  BOOST_CHECK( query(table, "chr1", 0, 10).empty() );   // end is exclusive
  BOOST_CHECK( query(table, "chr1", 11, 120).empty() );
  BOOST_CHECK( query(table, "chr3", 0, 1000).empty() );
  BOOST_CHECK( query(table, "chr1", 50, 50).empty() );  // empty interval

  vector<string> res = query(table, "chr1", 0, 1000);
  BOOST_REQUIRE_EQUAL( res.size(), 4u );
  BOOST_CHECK_EQUAL( res[0], "c1_10" );
  BOOST_CHECK_EQUAL( res[1], "c1_120" );
  BOOST_CHECK_EQUAL( res[2], "c1_200" );
  BOOST_CHECK_EQUAL( res[3], "c1_300" );

  // partial overlap at either end of a multi-base position
  res = query(table, "chr1", 202, 250);
  BOOST_REQUIRE_EQUAL( res.size(), 1u );
  BOOST_CHECK_EQUAL( res[0], "c1_200" );
  res = query(table, "chr1", 150, 201);
  BOOST_REQUIRE_EQUAL( res.size(), 1u );
  BOOST_CHECK_EQUAL( res[0], "c1_200" );
  BOOST_CHECK( query(table, "chr1", 203, 300).empty() );

  // overlap via Locus
  vector<const PositionOfInterest*> vec_pos;
  BOOST_CHECK_EQUAL( table.overlapping(seqio::Locus("chr2", 40, 60), vec_pos), 1u );
  BOOST_CHECK_EQUAL( vec_pos[0]->label, "c2_50" );
}

/* results do not depend on the order of queries */
BOOST_AUTO_TEST_CASE( table_overlap_order )
{
  PositionTable table(rows);
  vector<pair<TCoord, TCoord>> queries = { {0, 15}, {100, 250}, {301, 400}, {0, 1000}, {119, 121} };
  vector<vector<string>> first;
  for (auto q : queries) first.push_back(query(table, "chr1", q.first, q.second));
  reverse(queries.begin(), queries.end());
  reverse(first.begin(), first.end());
  for (size_t i=0; i<queries.size(); i++) {
    BOOST_CHECK( query(table, "chr1", queries[i].first, queries[i].second) == first[i] );
  }
}

/* positions that overlap each other, with a long one hiding short ones behind it */
BOOST_AUTO_TEST_CASE( table_overlap_nested )
{
  vector<PositionRow> nested;
  nested.push_back(makeRow("chr1", 100, 110, "long", "AAAAAAAAAA", {"CCCCCCCCCC"}));
  nested.push_back(makeRow("chr1", 101, 102, "inner1", "A", {"C"}));
  nested.push_back(makeRow("chr1", 104, 105, "inner2", "A", {"C"}));
  nested.push_back(makeRow("chr1", 120, 121, "after", "A", {"C"}));
  PositionTable table(nested);

  vector<string> res = query(table, "chr1", 107, 125);
  BOOST_REQUIRE_EQUAL( res.size(), 2u );
  BOOST_CHECK_EQUAL( res[0], "long" );
  BOOST_CHECK_EQUAL( res[1], "after" );

  res = query(table, "chr1", 104, 105);
  BOOST_REQUIRE_EQUAL( res.size(), 2u );
  BOOST_CHECK_EQUAL( res[0], "long" );
  BOOST_CHECK_EQUAL( res[1], "inner2" );
}

/* every configured allele classifies as itself */
BOOST_AUTO_TEST_CASE( classify_alleles )
{
  PositionTable table(rows);
  for (const PositionOfInterest& pos : table.positions()) {
    PositionCall call = classify(ExtractedBases(pos.wildtype), pos);
    BOOST_CHECK_EQUAL( call.type, CALL_WILDTYPE );
    BOOST_CHECK_EQUAL( call.tag(), "WT" );
    BOOST_CHECK( call.position == &pos );
    for (size_t i=0; i<pos.mutants.size(); i++) {
      call = classify(ExtractedBases(pos.mutants[i]), pos);
      BOOST_CHECK_EQUAL( call.type, CALL_MUTANT );
      BOOST_CHECK_EQUAL( call.idx_mutant, static_cast<int>(i) );
    }
  }
}

BOOST_AUTO_TEST_CASE( classify_rules )
{
  PositionOfInterest pos("chr1", 300, 302, "mnv", "AC", {"GT", "AA"});

  BOOST_CHECK_EQUAL( classify(ExtractedBases("ac"), pos).type, CALL_WILDTYPE );
  PositionCall call = classify(ExtractedBases("aA"), pos);
  BOOST_CHECK_EQUAL( call.type, CALL_MUTANT );
  BOOST_CHECK_EQUAL( call.tag(), "M1" );
  BOOST_CHECK_EQUAL( classify(ExtractedBases("CC"), pos).tag(), "AMB" );
  BOOST_CHECK_EQUAL( classify(ExtractedBases("NC"), pos).type, CALL_AMBIGUOUS );

  BOOST_CHECK_EQUAL( classify(ExtractedBases(SPAN_OUT_OF_RANGE), pos).tag(), "NC" );
  BOOST_CHECK_EQUAL( classify(ExtractedBases(SPAN_CLIPPED), pos).type, CALL_NOT_COVERED );
  BOOST_CHECK_EQUAL( classify(ExtractedBases(SPAN_DELETED), pos).type, CALL_AMBIGUOUS );
  BOOST_CHECK_EQUAL( classify(ExtractedBases(SPAN_INSERTION), pos).type, CALL_AMBIGUOUS );
  BOOST_CHECK_EQUAL( classify(ExtractedBases(SPAN_LOW_QUALITY), pos).type, CALL_AMBIGUOUS );

  // non-mutant calls carry no mutant index
  BOOST_CHECK_EQUAL( classify(ExtractedBases("AC"), pos).idx_mutant, -1 );
}

BOOST_AUTO_TEST_SUITE_END()
