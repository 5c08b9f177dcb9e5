#ifndef OB_UTIL_PARALLEL_HPP
#define OB_UTIL_PARALLEL_HPP

#include <algorithm>
#include <vector>

#include <libfilezilla/thread_pool.hpp>

namespace ob::util {

/// \brief Runs work(input, accumulator) for each of the inputs, spreading them across at most max_workers tasks of the pool.
///
/// Each task owns its own accumulator, so no locking is involved: once all tasks have completed,
/// the accumulators are concatenated in task order and returned.
/// If the pool can't spawn a task, its share of the work is done in the calling thread.
template <typename Result, typename Input, typename Work>
std::vector<Result> parallel_collect(fz::thread_pool &pool, std::size_t max_workers, const std::vector<Input> &inputs, const Work &work)
{
	auto num_workers = std::max<std::size_t>(1, std::min(max_workers, inputs.size()));

	std::vector<std::vector<Result>> accumulators(num_workers);
	std::vector<fz::async_task> tasks;
	tasks.reserve(num_workers);

	auto run = [&](std::size_t w) {
		for (std::size_t i = w; i < inputs.size(); i += num_workers)
			work(inputs[i], accumulators[w]);
	};

	for (std::size_t w = 1; w < num_workers; ++w) {
		auto task = pool.spawn([&run, w] { run(w); });
		if (!task)
			run(w);
		else
			tasks.push_back(std::move(task));
	}

	run(0);

	for (auto &t: tasks)
		t.join();

	std::vector<Result> res;
	for (auto &a: accumulators)
		res.insert(res.end(), std::make_move_iterator(a.begin()), std::make_move_iterator(a.end()));

	return res;
}

}

#endif // OB_UTIL_PARALLEL_HPP
