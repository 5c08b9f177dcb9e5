#include <libfilezilla/hash.hpp>

#include "../src/omnibust/token.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts the correctness of the cachebust token generation.
 */

using namespace ob;

class token_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(token_test);
	CPPUNIT_TEST(test_format);
	CPPUNIT_TEST(test_determinism);
	CPPUNIT_TEST(test_sensitivity);
	CPPUNIT_TEST(test_combine);
	CPPUNIT_TEST(test_multi);
	CPPUNIT_TEST_SUITE_END();

public:
	void test_format();
	void test_determinism();
	void test_sensitivity();
	void test_combine();
	void test_multi();

private:
	static static_resource resource(std::string relative, std::int64_t mtime, std::string_view content)
	{
		static_resource r;
		r.relative = std::move(relative);
		r.mtime = mtime;
		r.digest = fz::md5(content);

		return r;
	}
};

CPPUNIT_TEST_SUITE_REGISTRATION(token_test);

void token_test::test_format()
{
	auto digest = fz::md5(std::string_view("content"));

	for (std::size_t length = config::min_hash_length; length <= config::max_hash_length; ++length) {
		for (auto algorithm: { fz::hash_algorithm::md5, fz::hash_algorithm::sha1, fz::hash_algorithm::sha256, fz::hash_algorithm::sha512 }) {
			auto t = token::encode(1700000000123, digest, { algorithm, length });

			CPPUNIT_ASSERT_EQUAL(length, t.size());

			for (auto c: t)
				CPPUNIT_ASSERT((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'));
		}
	}
}

void token_test::test_determinism()
{
	auto digest = fz::md5(std::string_view("content"));

	auto a = token::encode(1700000000123, digest, {});
	auto b = token::encode(1700000000123, std::vector<std::uint8_t>(digest), {});

	CPPUNIT_ASSERT_EQUAL(a, b);

	// The stat part comes first, the content part follows.
	auto shorter = token::encode(1700000000123, digest, { fz::hash_algorithm::md5, 6 });
	CPPUNIT_ASSERT_EQUAL(a.substr(0, 3), shorter.substr(0, 3));
	CPPUNIT_ASSERT_EQUAL(a.substr(4, 3), shorter.substr(3, 3));
}

void token_test::test_sensitivity()
{
	auto base = token::encode(1000, fz::md5(std::string_view("content")), {});

	auto touched = token::encode(2000, fz::md5(std::string_view("content")), {});
	CPPUNIT_ASSERT(base != touched);
	CPPUNIT_ASSERT_EQUAL(base.substr(4), touched.substr(4));

	auto edited = token::encode(1000, fz::md5(std::string_view("c0ntent")), {});
	CPPUNIT_ASSERT(base != edited);
	CPPUNIT_ASSERT_EQUAL(base.substr(0, 4), edited.substr(0, 4));
}

void token_test::test_combine()
{
	auto a = fz::md5(std::string_view("a"));
	auto b = fz::md5(std::string_view("b"));

	CPPUNIT_ASSERT(token::combine({ a, b }, fz::hash_algorithm::md5) == token::combine({ b, a }, fz::hash_algorithm::md5));
	CPPUNIT_ASSERT(token::combine({ a, b }, fz::hash_algorithm::md5) != token::combine({ a, a }, fz::hash_algorithm::md5));
	CPPUNIT_ASSERT_EQUAL(std::size_t(32), token::combine({ a, b }, fz::hash_algorithm::sha256).size());
}

void token_test::test_multi()
{
	auto en = resource("i18n_en.png", 1000, "english");
	auto de = resource("i18n_de.png", 3000, "deutsch");

	match_result m;
	m.kind = match_result::multi;
	m.resources = { { "en", &en }, { "de", &de } };

	token::settings s;
	auto t = token::make(m, s);

	CPPUNIT_ASSERT_EQUAL(token::encode(3000, token::combine({ en.digest, de.digest }, s.algorithm), s), t);

	// Changing either variant changes the token.
	auto de2 = resource("i18n_de.png", 3000, "deutsch!");
	m.resources[1].second = &de2;
	CPPUNIT_ASSERT(token::make(m, s) != t);

	match_result single;
	single.kind = match_result::single;
	single.resources = { { "", &en } };
	CPPUNIT_ASSERT_EQUAL(token::make(en, s), token::make(single, s));

	match_result unmatched;
	CPPUNIT_ASSERT(token::make(unmatched, s).empty());
}
