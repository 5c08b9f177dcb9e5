#include <memory>

#include "../src/omnibust/config.hpp"
#include "../src/omnibust/project_init.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts the correctness of the generation of the initial configuration.
 */

using namespace ob;

class project_init_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(project_init_test);
	CPPUNIT_TEST(test_discover);
	CPPUNIT_TEST(test_render);
	CPPUNIT_TEST(test_run);
	CPPUNIT_TEST(test_empty_project);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override;
	void tearDown() override;

	void test_discover();
	void test_render();
	void test_run();
	void test_empty_project();

private:
	std::unique_ptr<test::temp_dir> dir_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(project_init_test);

void project_init_test::setUp()
{
	dir_ = std::make_unique<test::temp_dir>();

	dir_->write("static/img/logo.png", "logo");
	dir_->write("static/img/icons/home.svg", "<svg/>");
	dir_->write("static/css/site.css", "body{}");
	dir_->write("templates/index.html", "<img src=\"/static/img/logo.png\">\n<link href=\"/static/css/site.css\">\n");
	dir_->write("templates/partials/nav.html", "<img src=\"/static/img/icons/home.svg?_cb_=00000000\">\n");
	dir_->write("README.md", "Nothing to see here.\n");
	dir_->write(".git/objects/logo.png", "ignored");
}

void project_init_test::tearDown()
{
	dir_.reset();
}

void project_init_test::test_discover()
{
	project_init::proposal p;
	CPPUNIT_ASSERT(project_init::discover(dir_->path(), p));

	CPPUNIT_ASSERT_EQUAL(std::size_t(2), p.static_dirs.size());
	CPPUNIT_ASSERT_EQUAL(std::string("static/css"), p.static_dirs[0]);
	CPPUNIT_ASSERT_EQUAL(std::string("static/img"), p.static_dirs[1]);

	CPPUNIT_ASSERT_EQUAL(std::size_t(1), p.code_dirs.size());
	CPPUNIT_ASSERT_EQUAL(std::string("templates"), p.code_dirs[0]);

	// A reference from the top level directory covers everything.
	dir_->write("index.html", "<img src=\"static/img/logo.png\">");

	CPPUNIT_ASSERT(project_init::discover(dir_->path(), p));
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), p.code_dirs.size());
	CPPUNIT_ASSERT_EQUAL(std::string("."), p.code_dirs[0]);

	CPPUNIT_ASSERT(!project_init::discover(*dir_ / "nonexistent", p));
}

void project_init_test::test_render()
{
	project_init::proposal p;
	p.static_dirs = { "static", "media/\"quoted\"" };
	p.code_dirs = { "templates" };

	auto text = project_init::render(p);

	config cfg;
	CPPUNIT_ASSERT(parse(cfg, text));

	CPPUNIT_ASSERT_EQUAL(std::size_t(2), cfg.static_dirs.size());
	CPPUNIT_ASSERT_EQUAL(std::string("static"), cfg.static_dirs[0].dir);
	CPPUNIT_ASSERT_EQUAL(std::string("media/\"quoted\""), cfg.static_dirs[1].dir);
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), cfg.code_dirs.size());
	CPPUNIT_ASSERT_EQUAL(std::string("templates"), cfg.code_dirs[0].dir);

	CPPUNIT_ASSERT(config::default_static_filetypes == cfg.static_filetypes);
	CPPUNIT_ASSERT(config::default_code_filetypes == cfg.code_filetypes);
	CPPUNIT_ASSERT_EQUAL(std::size_t(8), cfg.hash_length);
	CPPUNIT_ASSERT(cfg.multibust.empty());
}

void project_init_test::test_run()
{
	std::string text;

	CPPUNIT_ASSERT(project_init::run(dir_->path(), true, text) == project_init::status::printed);
	CPPUNIT_ASSERT(!text.empty());
	CPPUNIT_ASSERT(fz::local_filesys::get_file_type(*dir_ / project_init::config_file_name) == fz::local_filesys::unknown);

	std::string written;
	CPPUNIT_ASSERT(project_init::run(dir_->path(), false, written) == project_init::status::written);
	CPPUNIT_ASSERT_EQUAL(text, written);
	CPPUNIT_ASSERT_EQUAL(text, dir_->read(project_init::config_file_name));

	config cfg;
	CPPUNIT_ASSERT(load(cfg, *dir_ / project_init::config_file_name));

	// Never overwritten.
	dir_->write(project_init::config_file_name, "{}");
	CPPUNIT_ASSERT(project_init::run(dir_->path(), false, written) == project_init::status::exists);
	CPPUNIT_ASSERT_EQUAL(std::string("{}"), dir_->read(project_init::config_file_name));
}

void project_init_test::test_empty_project()
{
	test::temp_dir empty;

	project_init::proposal p;
	CPPUNIT_ASSERT(project_init::discover(empty.path(), p));
	CPPUNIT_ASSERT(p.static_dirs.empty());
	CPPUNIT_ASSERT(p.code_dirs.empty());

	std::string text;
	CPPUNIT_ASSERT(project_init::run(empty.path(), false, text) == project_init::status::written);
	CPPUNIT_ASSERT(!text.empty());
}
