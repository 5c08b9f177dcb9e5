#include <algorithm>

#include <sys/stat.h>

#include "../src/omnibust/patcher.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts the correctness of the edit application and of the atomic replacement of files.
 */

using namespace ob;

class patcher_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(patcher_test);
	CPPUNIT_TEST(test_apply_edits);
	CPPUNIT_TEST(test_invalid_edits);
	CPPUNIT_TEST(test_preview);
	CPPUNIT_TEST(test_preview_same_line);
	CPPUNIT_TEST(test_write);
	CPPUNIT_TEST(test_stale_file);
	CPPUNIT_TEST(test_dry_run);
	CPPUNIT_TEST(test_cancel);
	CPPUNIT_TEST_SUITE_END();

public:
	void test_apply_edits();
	void test_invalid_edits();
	void test_preview();
	void test_preview_same_line();
	void test_write();
	void test_stale_file();
	void test_dry_run();
	void test_cancel();

private:
	static edit make_edit(std::string_view content, std::string_view original, std::string replacement, std::size_t line = 1)
	{
		edit e;
		e.offset = content.find(original);
		e.length = original.size();
		e.line = line;
		e.original = std::string(original);
		e.replacement = std::move(replacement);

		return e;
	}
};

CPPUNIT_TEST_SUITE_REGISTRATION(patcher_test);

namespace {

const std::string_view page =
	"<link href=\"/css/site.css\">\r\n"
	"<img src=\"/img/logo.png\">\r\n"
	"<script src=\"/js/app.js?_cb_=00000000\"></script>\r\n";

}

void patcher_test::test_apply_edits()
{
	std::string content(page);
	std::string reason;

	// Given in order, applied from the end.
	std::vector<edit> edits = {
		make_edit(page, "/css/site.css", "/css/site.css?_cb_=aaaaaaaa", 1),
		make_edit(page, "/img/logo.png", "/img/logo.png?_cb_=bbbbbbbb", 2),
		make_edit(page, "/js/app.js?_cb_=00000000", "/js/app.js?_cb_=cccccccc", 3)
	};

	CPPUNIT_ASSERT(apply_edits(content, edits, reason));
	CPPUNIT_ASSERT_EQUAL(std::string(
		"<link href=\"/css/site.css?_cb_=aaaaaaaa\">\r\n"
		"<img src=\"/img/logo.png?_cb_=bbbbbbbb\">\r\n"
		"<script src=\"/js/app.js?_cb_=cccccccc\"></script>\r\n"), content);

	// Order doesn't matter.
	std::string reversed(page);
	std::reverse(edits.begin(), edits.end());
	CPPUNIT_ASSERT(apply_edits(reversed, edits, reason));
	CPPUNIT_ASSERT_EQUAL(content, reversed);

	// No edits, no changes.
	content = page;
	CPPUNIT_ASSERT(apply_edits(content, {}, reason));
	CPPUNIT_ASSERT_EQUAL(std::string(page), content);
}

void patcher_test::test_invalid_edits()
{
	std::string reason;

	{
		std::string content(page);
		auto e = make_edit(page, "/img/logo.png", "/img/logo.png?_cb_=bbbbbbbb", 2);
		e.original = "/img/other.png";

		CPPUNIT_ASSERT(!apply_edits(content, { make_edit(page, "/css/site.css", "x"), e }, reason));
		CPPUNIT_ASSERT_EQUAL(std::string(page), content);
		CPPUNIT_ASSERT(reason.find("line 2") != std::string::npos);
	}

	{
		std::string content(page);
		auto e = make_edit(page, "/img/logo.png", "x", 2);
		e.offset = page.size() - 2;

		CPPUNIT_ASSERT(!apply_edits(content, { e }, reason));
		CPPUNIT_ASSERT_EQUAL(std::string(page), content);
	}

	{
		std::string content(page);
		auto a = make_edit(page, "/img/logo.png", "x", 2);
		auto b = make_edit(page, "logo.png\"", "y", 2);

		CPPUNIT_ASSERT(!apply_edits(content, { a, b }, reason));
		CPPUNIT_ASSERT(reason.find("overlaps") != std::string::npos);
		CPPUNIT_ASSERT_EQUAL(std::string(page), content);
	}
}

void patcher_test::test_preview()
{
	auto preview = make_preview(page, {
		make_edit(page, "/img/logo.png", "/img/logo.png?_cb_=bbbbbbbb", 2),
		make_edit(page, "/css/site.css", "/css/site.css?_cb_=aaaaaaaa", 1)
	});

	CPPUNIT_ASSERT_EQUAL(std::size_t(2), preview.size());

	CPPUNIT_ASSERT_EQUAL(std::size_t(1), preview[0].line);
	CPPUNIT_ASSERT_EQUAL(std::string("<link href=\"/css/site.css\">"), preview[0].before);
	CPPUNIT_ASSERT_EQUAL(std::string("<link href=\"/css/site.css?_cb_=aaaaaaaa\">"), preview[0].after);

	CPPUNIT_ASSERT_EQUAL(std::size_t(2), preview[1].line);
	CPPUNIT_ASSERT_EQUAL(std::string("<img src=\"/img/logo.png\">"), preview[1].before);
	CPPUNIT_ASSERT_EQUAL(std::string("<img src=\"/img/logo.png?_cb_=bbbbbbbb\">"), preview[1].after);
}

void patcher_test::test_preview_same_line()
{
	std::string_view row = "a\n<img src=\"/a.png\"><img src=\"/b.png?_cb_=00000000\">\nb\n";

	auto preview = make_preview(row, {
		make_edit(row, "/b.png?_cb_=00000000", "/b.png?_cb_=bbbbbbbb", 2),
		make_edit(row, "/a.png", "/a.png?_cb_=aaaaaaaa", 2)
	});

	CPPUNIT_ASSERT_EQUAL(std::size_t(1), preview.size());
	CPPUNIT_ASSERT_EQUAL(std::size_t(2), preview[0].line);
	CPPUNIT_ASSERT_EQUAL(std::string("<img src=\"/a.png\"><img src=\"/b.png?_cb_=00000000\">"), preview[0].before);
	CPPUNIT_ASSERT_EQUAL(std::string("<img src=\"/a.png?_cb_=aaaaaaaa\"><img src=\"/b.png?_cb_=bbbbbbbb\">"), preview[0].after);
}

void patcher_test::test_write()
{
	test::temp_dir dir;
	dir.write("index.html", page);

	auto path = dir / "index.html";
	CPPUNIT_ASSERT_EQUAL(0, ::chmod(path.c_str(), 0640));

	file_edits f;
	f.path = path;
	f.name = "index.html";
	f.edits = { make_edit(page, "/img/logo.png", "/img/logo.png?_cb_=bbbbbbbb", 2) };

	auto res = patcher().apply(f, false);
	CPPUNIT_ASSERT_EQUAL(patch_result::written, res.status);
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), res.edits);
	CPPUNIT_ASSERT_EQUAL(std::string("index.html"), res.name);

	std::string expected(page);
	expected.replace(f.edits[0].offset, f.edits[0].length, f.edits[0].replacement);
	CPPUNIT_ASSERT_EQUAL(expected, dir.read("index.html"));

	bool is_link{};
	int mode{};
	CPPUNIT_ASSERT_EQUAL(fz::local_filesys::file, fz::local_filesys::get_file_info(path, is_link, nullptr, nullptr, &mode));
	CPPUNIT_ASSERT_EQUAL(0640, mode & 07777);

	// No temporary files are left behind.
	std::vector<util::fs::walk_entry> entries;
	CPPUNIT_ASSERT(util::fs::walker().walk(dir.path(), {}, entries));
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), entries.size());

	// Nothing to do for no edits.
	f.edits.clear();
	CPPUNIT_ASSERT_EQUAL(patch_result::unchanged, patcher().apply(f, false).status);
	CPPUNIT_ASSERT_EQUAL(expected, dir.read("index.html"));
}

void patcher_test::test_stale_file()
{
	test::temp_dir dir;
	dir.write("index.html", page);

	file_edits f;
	f.path = dir / "index.html";
	f.name = "index.html";
	f.edits = { make_edit(page, "/img/logo.png", "/img/logo.png?_cb_=bbbbbbbb", 2) };

	// Changed behind our back.
	dir.write("index.html", "<img src=\"/img/other.png\">\n");

	auto res = patcher().apply(f, false);
	CPPUNIT_ASSERT_EQUAL(patch_result::skipped_stale, res.status);
	CPPUNIT_ASSERT(!res.reason.empty());
	CPPUNIT_ASSERT_EQUAL(std::string("<img src=\"/img/other.png\">\n"), dir.read("index.html"));

	// Gone altogether.
	f.path = dir / "gone.html";
	CPPUNIT_ASSERT_EQUAL(patch_result::failed, patcher().apply(f, false).status);
}

void patcher_test::test_dry_run()
{
	test::temp_dir dir;
	dir.write("index.html", page);

	file_edits f;
	f.path = dir / "index.html";
	f.name = "index.html";
	f.edits = { make_edit(page, "/css/site.css", "/css/site.css?_cb_=aaaaaaaa", 1) };

	auto res = patcher().apply(f, true);
	CPPUNIT_ASSERT_EQUAL(patch_result::dry_run, res.status);
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), res.preview.size());
	CPPUNIT_ASSERT_EQUAL(std::string("<link href=\"/css/site.css?_cb_=aaaaaaaa\">"), res.preview[0].after);
	CPPUNIT_ASSERT_EQUAL(std::string(page), dir.read("index.html"));
}

void patcher_test::test_cancel()
{
	test::temp_dir dir;
	dir.write("index.html", page);

	file_edits f;
	f.path = dir / "index.html";
	f.name = "index.html";
	f.edits = { make_edit(page, "/css/site.css", "/css/site.css?_cb_=aaaaaaaa", 1) };

	std::atomic<bool> cancel{true};

	CPPUNIT_ASSERT_EQUAL(patch_result::cancelled, patcher().apply(f, false, &cancel).status);
	CPPUNIT_ASSERT_EQUAL(std::string(page), dir.read("index.html"));
}
