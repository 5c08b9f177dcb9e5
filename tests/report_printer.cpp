#include <sstream>

#include "../src/cli/report_printer.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts what the command line reports, depending on the mode and the verbosity.
 */

using namespace ob;

class report_printer_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(report_printer_test);
	CPPUNIT_TEST(test_quiet);
	CPPUNIT_TEST(test_dry_run_preview);
	CPPUNIT_TEST(test_scan);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override;

	void test_quiet();
	void test_dry_run_preview();
	void test_scan();

private:
	std::string print(cli::report_printer::verbosity_type verbosity) const
	{
		std::ostringstream out;
		cli::report_printer(out, verbosity).print(rep_);

		return out.str();
	}

	static bool contains(const std::string &text, std::string_view what)
	{
		return text.find(what) != std::string::npos;
	}

	report rep_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(report_printer_test);

void report_printer_test::setUp()
{
	rep_.run_mode = mode::rewrite;
	rep_.resources_indexed = 3;
	rep_.files_scanned = 1;

	reference_report css;
	css.name = "index.html";
	css.line = 3;
	css.literal = "/css/site.css";
	css.match = match_result::ambiguous;
	css.result = outcome::ambiguous;
	css.reason = "matches resources with different contents";

	reference_report missing;
	missing.name = "index.html";
	missing.line = 5;
	missing.literal = "/img/missing.png";
	missing.result = outcome::unmatched;
	missing.reason = "no such static resource";

	reference_report logo;
	logo.name = "index.html";
	logo.line = 4;
	logo.literal = "/img/logo.png";
	logo.match = match_result::single;
	logo.result = outcome::unmarked;
	logo.todo = action::insert;
	logo.token = "abcd1234";
	logo.replacement = "/img/logo.png?_cb_=abcd1234";

	rep_.references = { css, logo, missing };

	rep_.totals.references = 3;
	rep_.totals.ambiguous = 1;
	rep_.totals.unmatched = 1;
	rep_.totals.unmarked = 1;
	rep_.totals.inserted = 1;

	patch_result f;
	f.name = "index.html";
	f.status = patch_result::written;
	f.edits = 1;
	rep_.files = { f };
	rep_.totals.files_written = 1;
}

void report_printer_test::test_quiet()
{
	auto text = print(cli::report_printer::quiet);

	// Conflicts and unmatched references are never left out.
	CPPUNIT_ASSERT(contains(text, "ambiguous : index.html:3: /css/site.css (matches resources with different contents)"));
	CPPUNIT_ASSERT(contains(text, "unmatched : index.html:5: /img/missing.png (no such static resource)"));

	CPPUNIT_ASSERT(!contains(text, "inserted"));
	CPPUNIT_ASSERT(!contains(text, "wrote"));
	CPPUNIT_ASSERT(!contains(text, "files scanned"));

	rep_.files[0].status = patch_result::failed;
	rep_.files[0].reason = "could not replace the file";
	CPPUNIT_ASSERT(contains(print(cli::report_printer::quiet), "failed    : index.html (could not replace the file)"));
}

void report_printer_test::test_dry_run_preview()
{
	rep_.dry_run = true;
	rep_.totals.files_written = 0;
	rep_.files[0].status = patch_result::dry_run;
	rep_.files[0].preview = { { 4, "<img src=\"/img/logo.png\">", "<img src=\"/img/logo.png?_cb_=abcd1234\">" } };

	auto text = print(cli::report_printer::normal);

	CPPUNIT_ASSERT(contains(text, "inserted  : index.html:4: /img/logo.png -> /img/logo.png?_cb_=abcd1234\n"));
	CPPUNIT_ASSERT(contains(text,
		"--- index.html:4\n"
		"- <img src=\"/img/logo.png\">\n"
		"+ <img src=\"/img/logo.png?_cb_=abcd1234\">\n"));
	CPPUNIT_ASSERT(contains(text, "Dry run: 1 inserted, 0 busted, 0 converted; 0 files written, 0 skipped, 0 failed."));
	CPPUNIT_ASSERT(!contains(text, "wrote"));
}

void report_printer_test::test_scan()
{
	rep_.run_mode = mode::scan;
	rep_.references[1].todo = action::none;
	rep_.references[1].replacement.clear();
	rep_.files.clear();
	rep_.totals.inserted = 0;
	rep_.totals.files_written = 0;

	auto text = print(cli::report_printer::normal);

	CPPUNIT_ASSERT(contains(text, "unmarked  : index.html:4: /img/logo.png [abcd1234]"));
	CPPUNIT_ASSERT(contains(text, "ambiguous : index.html:3"));
	CPPUNIT_ASSERT(contains(text, "3 static resources, 1 files scanned, 3 references: 0 current, 0 stale, 1 unmarked, 1 unmatched, 1 ambiguous."));

	// Nothing is ever edited in scan mode.
	CPPUNIT_ASSERT(!contains(text, "inserted"));
	CPPUNIT_ASSERT(!contains(text, "files written"));
}
