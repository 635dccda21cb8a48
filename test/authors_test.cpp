// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE authors
#include <boost/test/unit_test.hpp>

#include <boost/filesystem.hpp>
#include <fstream>

#include "authors.hpp"

using namespace git_migrator;
namespace fs = boost::filesystem;

BOOST_AUTO_TEST_CASE(mapped_and_unmapped_users)
  {
  std::map<std::string, std::string> entries;
  entries["alice"] = "Alice Smith <alice@example.com>";
  Authors authors(entries);

  identity alice = authors["alice"];
  BOOST_CHECK_EQUAL(alice.first, "Alice Smith");
  BOOST_CHECK_EQUAL(alice.second, "alice@example.com");

  identity bob = authors["bob"];
  BOOST_CHECK_EQUAL(bob.first, "bob");
  BOOST_CHECK_EQUAL(bob.second, "bob@users.noreply.cvs.example.org");
  }

BOOST_AUTO_TEST_CASE(malformed_mapping_falls_back_to_default)
  {
  Authors authors;
  authors.add("carol", "Carol without email");
  authors.add("dave", "<dave@example.com>");

  BOOST_CHECK_EQUAL(authors["carol"].first, "carol");
  BOOST_CHECK_EQUAL(authors["carol"].second, Authors::default_email("carol"));
  BOOST_CHECK_EQUAL(authors["dave"].second, Authors::default_email("dave"));
  }

BOOST_AUTO_TEST_CASE(identity_is_trimmed)
  {
  identity who;
  BOOST_REQUIRE(parse_identity("  Eve   Jones  < eve@example.org >", who));
  BOOST_CHECK_EQUAL(who.first, "Eve   Jones");
  BOOST_CHECK_EQUAL(who.second, "eve@example.org");
  BOOST_CHECK(!parse_identity("no brackets", who));
  }

BOOST_AUTO_TEST_CASE(authors_file)
  {
  fs::path file = fs::temp_directory_path() / fs::unique_path("authors-%%%%-%%%%.txt");
  {
      std::ofstream out(file.string().c_str());
      out << "# cvs user = Git identity\n"
          << "\n"
          << "alice = Alice Smith <alice@example.com>\n"
          << "bob=Bob Brown <bob@example.com>   \n";
  }
  Authors authors;
  authors.load(file.string());
  BOOST_CHECK_EQUAL(authors.size(), 2u);
  BOOST_CHECK_EQUAL(authors["bob"].first, "Bob Brown");
  BOOST_CHECK_EQUAL(authors["bob"].second, "bob@example.com");

  {
      std::ofstream out(file.string().c_str());
      out << "just a name\n";
  }
  BOOST_CHECK_THROW(authors.load(file.string()), std::runtime_error);
  fs::remove(file);

  BOOST_CHECK_THROW(authors.load(file.string()), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(extractor_lists_unique_authors)
  {
  AuthorExtractor extractor;
  extractor.add("bob");
  extractor.add("alice");
  extractor.add("bob");

  BOOST_REQUIRE_EQUAL(extractor.list().size(), 2u);
  BOOST_CHECK_EQUAL(*extractor.list().begin(), "alice");
  BOOST_CHECK_EQUAL(extractor.authors_file_template(),
                    "alice = alice <alice@example.com>\n"
                    "bob = bob <bob@example.com>\n");
  }
