#ifndef OB_UTIL_SCOPE_GUARD_HPP
#define OB_UTIL_SCOPE_GUARD_HPP

#include <utility>

namespace ob::util {

//! Runs the given callable when going out of scope, unless dismissed before.
template<class F>
class scope_guard
{
public:
	scope_guard(F && f)
		: f_(std::forward<F>(f))
	{}

	scope_guard(const scope_guard &) = delete;
	scope_guard(scope_guard &&) = delete;
	scope_guard &operator=(const scope_guard &) = delete;
	scope_guard &operator=(scope_guard &&) = delete;

	~scope_guard()
	{
		if (armed_)
			f_();
	}

	void dismiss()
	{
		armed_ = false;
	}

private:
	F f_;
	bool armed_{true};
};

template<class F>
scope_guard(F && f) -> scope_guard<F>;

}

#endif // OB_UTIL_SCOPE_GUARD_HPP
