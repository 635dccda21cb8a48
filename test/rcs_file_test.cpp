// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE rcs_file
#include <boost/test/unit_test.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <sstream>

#include "rcs_file.hpp"

using namespace git_migrator;
namespace pt = boost::posix_time;

static char const sample[] =
    "head\t1.3;\n"
    "access;\n"
    "symbols\n"
    "\tRELEASE_1_0:1.2\n"
    "\tFEATURE:1.2.0.2;\n"
    "locks; strict;\n"
    "comment\t@# @;\n"
    "\n"
    "\n"
    "1.3\n"
    "date\t2024.03.01.12.00.00;\tauthor bob;\tstate Exp;\n"
    "branches;\n"
    "next\t1.2;\n"
    "\n"
    "1.2\n"
    "date\t2024.02.01.12.00.00;\tauthor alice;\tstate Exp;\n"
    "branches;\n"
    "next\t1.1;\n"
    "\n"
    "1.1\n"
    "date\t99.01.01.08.30.00;\tauthor alice;\tstate Exp;\n"
    "branches;\n"
    "next\t;\n"
    "\n"
    "\n"
    "desc\n"
    "@A sample file@\n"
    "\n"
    "\n"
    "1.3\n"
    "log\n"
    "@Mail user@@example.com\n"
    "@\n"
    "text\n"
    "@line one\n"
    "line two changed\n"
    "line three\n"
    "@\n"
    "\n"
    "\n"
    "1.2\n"
    "log\n"
    "@Second revision\n"
    "@\n"
    "text\n"
    "@d2 1\n"
    "a2 1\n"
    "line two\n"
    "@\n"
    "\n"
    "\n"
    "1.1\n"
    "log\n"
    "@Initial revision\n"
    "@\n"
    "text\n"
    "@d2 2\n"
    "@\n";

static rcs_file parse_sample()
{
    std::istringstream in(sample);
    return parse_rcs(in, "sample,v");
}

BOOST_AUTO_TEST_CASE(admin_section)
  {
  rcs_file rcs = parse_sample();
  BOOST_CHECK_EQUAL(rcs.head, "1.3");
  BOOST_CHECK(rcs.access.empty());
  BOOST_CHECK(rcs.strict);
  BOOST_CHECK_EQUAL(rcs.comment, "# ");
  BOOST_CHECK_EQUAL(rcs.description, "A sample file");
  BOOST_REQUIRE_EQUAL(rcs.symbols.size(), 2u);
  BOOST_CHECK_EQUAL(rcs.symbols[0].first, "RELEASE_1_0");
  BOOST_CHECK_EQUAL(rcs.symbols[0].second, "1.2");
  BOOST_CHECK_EQUAL(rcs.symbols[1].first, "FEATURE");
  BOOST_CHECK_EQUAL(rcs.symbols[1].second, "1.2.0.2");
  }

BOOST_AUTO_TEST_CASE(delta_section)
  {
  rcs_file rcs = parse_sample();
  std::vector<std::string> order = { "1.3", "1.2", "1.1" };
  BOOST_CHECK(rcs.delta_order == order);
  BOOST_CHECK(rcs.trunk() == order);

  rcs_delta const& d = rcs.delta("1.2");
  BOOST_CHECK_EQUAL(d.author, "alice");
  BOOST_CHECK_EQUAL(d.state, "Exp");
  BOOST_CHECK_EQUAL(d.next, "1.1");
  BOOST_CHECK_EQUAL(d.date, pt::time_from_string("2024-02-01 12:00:00"));
  BOOST_CHECK_EQUAL(d.log, "Second revision\n");
  BOOST_CHECK(!d.dead());

  BOOST_CHECK_EQUAL(rcs.delta("1.3").log, "Mail user@example.com\n");
  BOOST_CHECK_EQUAL(rcs.delta("1.1").date, pt::time_from_string("1999-01-01 08:30:00"));
  BOOST_CHECK_THROW(rcs.delta("1.9"), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(trunk_texts_apply_reverse_diffs)
  {
  std::map<std::string, std::string> texts = parse_sample().trunk_texts();
  BOOST_CHECK_EQUAL(texts["1.3"], "line one\nline two changed\nline three\n");
  BOOST_CHECK_EQUAL(texts["1.2"], "line one\nline two\nline three\n");
  BOOST_CHECK_EQUAL(texts["1.1"], "line one\n");
  }

BOOST_AUTO_TEST_CASE(diff_commands)
  {
  std::string const base = "a\nb\nc\n";
  BOOST_CHECK_EQUAL(apply_rcs_diff(base, ""), base);
  BOOST_CHECK_EQUAL(apply_rcs_diff(base, "a0 1\nfirst\n"), "first\na\nb\nc\n");
  BOOST_CHECK_EQUAL(apply_rcs_diff(base, "a3 1\nlast\n"), "a\nb\nc\nlast\n");
  BOOST_CHECK_EQUAL(apply_rcs_diff(base, "d1 3\n"), "");
  BOOST_CHECK_EQUAL(apply_rcs_diff(base, "d1 1\na2 2\nx\ny\n"), "b\nx\ny\nc\n");

  BOOST_CHECK_THROW(apply_rcs_diff(base, "d3 2\n"), std::runtime_error);
  BOOST_CHECK_THROW(apply_rcs_diff(base, "a9 1\nx\n"), std::runtime_error);
  BOOST_CHECK_THROW(apply_rcs_diff(base, "a1 3\nx\n"), std::runtime_error);
  BOOST_CHECK_THROW(apply_rcs_diff(base, "x1 1\n"), std::runtime_error);
  BOOST_CHECK_THROW(apply_rcs_diff(base, "d2 1\nd1 1\n"), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(dates)
  {
  BOOST_CHECK_EQUAL(parse_rcs_date("2001.10.05.17.45.02"), pt::time_from_string("2001-10-05 17:45:02"));
  BOOST_CHECK_EQUAL(parse_rcs_date("95.06.30.00.00.00"), pt::time_from_string("1995-06-30 00:00:00"));
  BOOST_CHECK_THROW(parse_rcs_date("2001.10.05"), std::runtime_error);
  BOOST_CHECK_THROW(parse_rcs_date("2001.10.05.xx.45.02"), std::runtime_error);
  BOOST_CHECK_THROW(parse_rcs_date("2024.13.01.12.00.00"), std::runtime_error);
  BOOST_CHECK_THROW(parse_rcs_date("2024.02.30.12.00.00"), std::runtime_error);
  BOOST_CHECK_THROW(parse_rcs_date("2024.02.01.25.00.00"), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(branch_numbers)
  {
  BOOST_CHECK(is_branch_number("1.2.0.2"));
  BOOST_CHECK(is_branch_number("1.1.1"));
  BOOST_CHECK(!is_branch_number("1.2"));
  BOOST_CHECK(!is_branch_number("1.2.2.1"));
  }

BOOST_AUTO_TEST_CASE(malformed_files)
  {
  std::istringstream not_rcs("hello world\n");
  BOOST_CHECK_THROW(parse_rcs(not_rcs, "x,v"), rcs_parse_error);

  std::istringstream unterminated("head 1.1;\n\n1.1\ndate 2024.01.01.00.00.00; author a; state Exp;\n"
                                  "branches; next ;\n\ndesc\n@oops\n");
  try
  {
      parse_rcs(unterminated, "y,v");
      BOOST_ERROR("unterminated string must not parse");
  }
  catch (rcs_parse_error const& e)
  {
      BOOST_CHECK_EQUAL(e.line, 8u);
      BOOST_CHECK(std::string(e.what()).find("y,v:8:") == 0);
  }

  std::istringstream bad_date("head 1.1;\n\n1.1\ndate yesterday; author a; state Exp;\n"
                              "branches; next ;\n\ndesc\n@@\n");
  BOOST_CHECK_THROW(parse_rcs(bad_date, "z,v"), rcs_parse_error);

  std::istringstream unknown_text("head 1.1;\n\n1.1\ndate 2024.01.01.00.00.00; author a; state Exp;\n"
                                  "branches; next ;\n\ndesc\n@@\n\n1.7\nlog\n@@\ntext\n@@\n");
  BOOST_CHECK_THROW(parse_rcs(unknown_text, "w,v"), rcs_parse_error);
  }
