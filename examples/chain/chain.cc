#include <vow/future.h>
#include <vow/scheduler.h>
#include <iostream>
#include <stdexcept>

int
main()
{
	auto q = vow::global_task_queue();

	/* Value chain: prints 2. */
	vow::future<int>([](vow::fulfiller<int> ok, vow::rejecter) { ok(1); })
	    .then([](int v) { return v + 1; })
	    .then([](int v) { std::cout << v << std::endl; });

	/* Recovery from a failed step: prints 3. */
	vow::future<int>([](vow::fulfiller<int> ok, vow::rejecter) { ok(1); })
	    .then([](int) -> int { throw std::runtime_error("step failed"); })
	    .catch_error([](std::exception_ptr) { return 3; })
	    .then([](int v) { std::cout << v << std::endl; });

	q->run();
	return 0;
}
