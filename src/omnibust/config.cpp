#include <libfilezilla/format.hpp>
#include <libfilezilla/json.hpp>

#include "config.hpp"
#include "util/io.hpp"
#include "util/tools.hpp"

namespace ob {

const std::vector<std::string> config::default_static_filetypes = {
	".png", ".gif", ".jpg", ".jpeg", ".ico", ".webp", ".svg",
	".js", ".css", ".swf",
	".mov", ".avi", ".mp4", ".webm", ".ogg",
	".wav", ".mp3", ".ogv", ".opus"
};

const std::vector<std::string> config::default_code_filetypes = {
	".htm", ".html", ".jade", ".erb", ".haml", ".txt", ".md",
	".css", ".sass", ".less", ".scss",
	".xml", ".json", ".yaml", ".cfg", ".ini",
	".js", ".coffee", ".dart", ".ts",
	".py", ".rb", ".php", ".java", ".pl", ".cs", ".lua"
};

const util::glob_list config::default_ignore_dirs = {
	"*lib/*", "*lib64/*", "*.git/*", "*.hg/*", "*.svn/*"
};

const std::string config::default_delimiters = "\"'`()<>=,; \t\r\n";

std::string_view to_string(mode m)
{
	using namespace std::string_view_literals;

	switch (m) {
		case mode::init:    return "init"sv;
		case mode::scan:    return "scan"sv;
		case mode::rewrite: return "rewrite"sv;
		case mode::update:  return "update"sv;
	}

	return {};
}

bool convert(std::string_view s, mode &m)
{
	for (auto candidate: { mode::init, mode::scan, mode::rewrite, mode::update }) {
		if (s == to_string(candidate)) {
			m = candidate;
			return true;
		}
	}

	return false;
}

std::string_view to_string(fz::hash_algorithm a)
{
	using namespace std::string_view_literals;

	switch (a) {
		case fz::hash_algorithm::md5:    return "md5"sv;
		case fz::hash_algorithm::sha1:   return "sha1"sv;
		case fz::hash_algorithm::sha256: return "sha256"sv;
		case fz::hash_algorithm::sha512: return "sha512"sv;
	}

	return {};
}

bool convert(std::string_view s, fz::hash_algorithm &a)
{
	for (auto candidate: { fz::hash_algorithm::md5, fz::hash_algorithm::sha1, fz::hash_algorithm::sha256, fz::hash_algorithm::sha512 }) {
		if (fz::equal_insensitive_ascii(s, to_string(candidate))) {
			a = candidate;
			return true;
		}
	}

	return false;
}

std::string config::validate() const
{
	if (static_dirs.empty())
		return "no static directories have been configured (static_dirs)";

	if (code_dirs.empty())
		return "no code directories have been configured (code_dirs)";

	for (auto *roots: { &static_dirs, &code_dirs }) {
		for (auto &r: *roots) {
			if (r.dir.empty())
				return "a configured directory is empty";
		}
	}

	for (auto &r: static_dirs) {
		if (!r.url_prefix.empty() && r.url_prefix[0] != '/')
			return fz::sprintf("the url_prefix of static directory `%s' must begin with a slash", r.dir);
	}

	if (static_filetypes.empty())
		return "no static file types have been configured (static_filetypes)";

	for (auto *types: { &static_filetypes, &code_filetypes }) {
		for (auto &t: *types) {
			if (t.size() < 2 || t[0] != '.')
				return fz::sprintf("file type `%s' must be a dot followed by the extension", t);
		}
	}

	if (auto err = multibust.validate(); !err.empty())
		return err;

	if (marker.empty())
		return "the marker is empty";

	for (auto c: marker) {
		bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
		if (!ok)
			return fz::sprintf("the marker `%s' may only contain letters, digits, '_' and '-'", marker);
	}

	if (form == marker_form::none)
		return "the marker form must be either querystring or filename";

	if (hash_length < min_hash_length || hash_length > max_hash_length)
		return fz::sprintf("hash_length must be between %d and %d", min_hash_length, max_hash_length);

	if (delimiters.empty())
		return "no delimiters have been configured";

	if (delimiters.find_first_of("/.?#&") != std::string::npos)
		return "delimiters may not include any of / . ? # &";

	if (max_file_size == 0)
		return "max_file_size must be greater than zero";

	return {};
}

fz::native_string config::resolve_dir(const root_config &root) const
{
	return util::make_absolute(util::fs::to_native(root.dir), project_dir);
}

std::string strip_comments(std::string_view text)
{
	std::string res;
	res.reserve(text.size());

	bool in_string = false;

	for (std::size_t i = 0; i < text.size(); ++i) {
		char c = text[i];

		if (in_string) {
			res.append(1, c);

			if (c == '\\' && i+1 < text.size())
				res.append(1, text[++i]);
			else
			if (c == '"')
				in_string = false;

			continue;
		}

		if (c == '"') {
			in_string = true;
		}
		else
		if (c == '/' && i+1 < text.size() && text[i+1] == '/') {
			while (i < text.size() && text[i] != '\n')
				++i;

			if (i < text.size())
				res.append(1, '\n');

			continue;
		}

		res.append(1, c);
	}

	return res;
}

namespace {

class parser
{
public:
	parser(config &cfg, fz::logger_interface &logger)
		: cfg_(cfg)
		, logger_(logger)
	{}

	bool operator()(const fz::json &j)
	{
		if (j.type() != fz::json_type::object) {
			logger_.log_u(fz::logmsg::error, L"The configuration is not a JSON object.");
			return false;
		}

		roots(j, "static_dirs", cfg_.static_dirs);
		roots(j, "code_dirs", cfg_.code_dirs);
		strings(j, "static_filetypes", cfg_.static_filetypes);
		strings(j, "code_filetypes", cfg_.code_filetypes);
		strings(j, "ignore_dirs", cfg_.ignore_dirs);
		multibust(j);
		placeholder_syntax(j);
		string(j, "marker", cfg_.marker);
		string(j, "delimiters", cfg_.delimiters);
		integer(j, "hash_length", cfg_.hash_length);
		integer(j, "max_file_size", cfg_.max_file_size);
		integer(j, "threads", cfg_.threads);

		if (std::string form; string(j, "marker_form", form) && !convert(form, cfg_.form))
			fail("marker_form", "must be either \"querystring\" or \"filename\"");

		if (std::string hash; string(j, "hash_function", hash) && !convert(hash, cfg_.hash))
			fail("hash_function", "must be one of md5, sha1, sha256, sha512");

		if (auto &enc = j["file_encoding"]; enc)
			logger_.log_u(fz::logmsg::debug_warning, L"Configuration key `file_encoding' is ignored: files are processed as bytes.");

		return ok_;
	}

private:
	void fail(std::string_view key, std::string_view what)
	{
		logger_.log_u(fz::logmsg::error, L"Configuration key `%s' %s.", key, what);
		ok_ = false;
	}

	bool string(const fz::json &j, const char *key, std::string &out)
	{
		auto &v = j[key];
		if (!v)
			return false;

		if (v.type() != fz::json_type::string) {
			fail(key, "must be a string");
			return false;
		}

		out = v.string_value();
		return true;
	}

	void integer(const fz::json &j, const char *key, std::size_t &out)
	{
		auto &v = j[key];
		if (!v)
			return;

		if (v.type() != fz::json_type::number || v.number_value_integer() < 0) {
			fail(key, "must be a non-negative integer");
			return;
		}

		out = std::size_t(v.number_value_integer());
	}

	bool string_list(const fz::json &v, const char *key, std::vector<std::string> &out)
	{
		if (v.type() != fz::json_type::array) {
			fail(key, "must be a list of strings");
			return false;
		}

		std::vector<std::string> res;

		for (auto &e: v) {
			if (e.type() != fz::json_type::string) {
				fail(key, "must be a list of strings");
				return false;
			}

			res.push_back(e.string_value());
		}

		out = std::move(res);
		return true;
	}

	template <typename List>
	void strings(const fz::json &j, const char *key, List &out)
	{
		if (auto &v = j[key]; v) {
			std::vector<std::string> res;
			if (string_list(v, key, res))
				out.assign(res.begin(), res.end());
		}
	}

	void roots(const fz::json &j, const char *key, std::vector<root_config> &out)
	{
		auto &v = j[key];
		if (!v)
			return;

		if (v.type() != fz::json_type::array) {
			fail(key, "must be a list of directories");
			return;
		}

		std::vector<root_config> res;

		for (auto &e: v) {
			root_config r;

			if (e.type() == fz::json_type::string) {
				r.dir = e.string_value();
			}
			else
			if (e.type() == fz::json_type::object) {
				r.dir = e["dir"].string_value();
				r.url_prefix = e["url_prefix"].string_value();

				std::vector<std::string> globs;

				if (auto &inc = e["include"]; inc && string_list(inc, key, globs))
					r.include.assign(globs.begin(), globs.end());

				if (auto &exc = e["exclude"]; exc && string_list(exc, key, globs))
					r.exclude.assign(globs.begin(), globs.end());
			}
			else {
				fail(key, "entries must be either strings or objects");
				return;
			}

			if (r.dir.empty()) {
				fail(key, "entries must name a directory");
				return;
			}

			res.push_back(std::move(r));
		}

		out = std::move(res);
	}

	// fz::json doesn't list the members of an object: their names are read back from its serialization.
	static std::vector<std::string> member_names(const fz::json &object)
	{
		std::vector<std::string> res;

		auto text = object.to_string();
		std::size_t depth = 0;
		bool expect_name = false;

		for (std::size_t i = 0; i < text.size(); ++i) {
			auto c = text[i];

			if (c == '"') {
				auto end = i + 1;
				while (end < text.size() && text[end] != '"')
					end += text[end] == '\\' ? 2 : 1;

				if (depth == 1 && expect_name) {
					auto quoted = std::string_view(text).substr(i, end + 1 - i);
					res.push_back(fz::json::parse(std::string("{\"n\":").append(quoted).append("}"))["n"].string_value());
					expect_name = false;
				}

				i = end;
			}
			else
			if (c == '{' || c == '[') {
				if (++depth == 1)
					expect_name = c == '{';
			}
			else
			if (c == '}' || c == ']')
				--depth;
			else
			if (c == ',' && depth == 1)
				expect_name = true;
		}

		return res;
	}

	void multibust(const fz::json &j)
	{
		auto &v = j["multibust"];
		if (!v)
			return;

		multibust::rules res;

		// {"placeholder": ["value", ...], ...}, placeholders sorted by name.
		if (v.type() == fz::json_type::object) {
			for (auto &name: member_names(v)) {
				multibust::rule r;
				r.placeholder = name;

				if (!string_list(v[name], "multibust", r.values))
					return;

				res.push_back(std::move(r));
			}

			cfg_.multibust = std::move(res);
			return;
		}

		if (v.type() != fz::json_type::array) {
			fail("multibust", "must be either an object mapping placeholders to values, or a list of {\"placeholder\": ..., \"values\": [...]} objects");
			return;
		}

		for (auto &e: v) {
			if (e.type() != fz::json_type::object || e["placeholder"].type() != fz::json_type::string) {
				fail("multibust", "entries must be objects with a \"placeholder\" string");
				return;
			}

			multibust::rule r;
			r.placeholder = e["placeholder"].string_value();

			if (!string_list(e["values"], "multibust", r.values))
				return;

			res.push_back(std::move(r));
		}

		cfg_.multibust = std::move(res);
	}

	void placeholder_syntax(const fz::json &j)
	{
		auto &v = j["placeholder_syntax"];
		if (!v)
			return;

		if (v.type() != fz::json_type::array) {
			fail("placeholder_syntax", "must be a list of [opening, closing] pairs");
			return;
		}

		multibust::syntax res;

		for (auto &e: v) {
			std::vector<std::string> pair;
			if (!string_list(e, "placeholder_syntax", pair))
				return;

			if (pair.size() != 2 || pair[0].empty() || pair[1].empty()) {
				fail("placeholder_syntax", "entries must be pairs of non-empty strings");
				return;
			}

			res.emplace_back(std::move(pair[0]), std::move(pair[1]));
		}

		cfg_.placeholder_syntax = std::move(res);
	}

	config &cfg_;
	fz::logger_interface &logger_;
	bool ok_{true};
};

}

bool parse(config &cfg, std::string_view text, fz::logger_interface &logger)
{
	auto j = fz::json::parse(strip_comments(text));
	if (!j) {
		logger.log_u(fz::logmsg::error, L"The configuration is not valid JSON.");
		return false;
	}

	if (!parser(cfg, logger)(j))
		return false;

	if (auto err = cfg.validate(); !err.empty()) {
		logger.log_u(fz::logmsg::error, L"Invalid configuration: %s.", err);
		return false;
	}

	return true;
}

bool load(config &cfg, const fz::native_string &path, fz::logger_interface &logger)
{
	fz::buffer buf;

	if (auto err = util::io::read(path, buf, 1024*1024); err != util::io::read_error::none) {
		logger.log_u(fz::logmsg::error, L"Could not read configuration file `%s': %s.", path, util::io::describe(err));
		return false;
	}

	if (!parse(cfg, buf.to_view(), logger)) {
		logger.log_u(fz::logmsg::error, L"Error parsing `%s'.", path);
		return false;
	}

	return true;
}

}
