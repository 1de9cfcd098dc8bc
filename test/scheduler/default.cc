#include <vow/future.h>
#include <vow/scheduler.h>
#include "../test.h"

int
main()
{
	auto global = std::static_pointer_cast<vow::scheduler>(
	    vow::global_task_queue());
	test(vow::global_task_queue() == vow::global_task_queue(),
	    "one global queue");
	test(vow::default_scheduler() == global,
	    "global queue is the default");

	auto a = std::make_shared<vow::task_queue>();
	auto b = std::make_shared<vow::task_queue>();

	{
		vow::default_scheduler_guard ga{ a };
		test(vow::default_scheduler() == a, "guard installs a scheduler");

		{
			vow::default_scheduler_guard gb{ b };
			test(vow::default_scheduler() == b, "nested guard");
		}
		test(vow::default_scheduler() == a, "nested guard restores");

		auto f = vow::make_fulfilled_future(5);
		test(f.get_scheduler() == a, "factories use the default");
		int seen = 0;
		f.then([&seen](int v) { seen = v; });
		test(a->size() == 1, "continuation deferred on the default");
		a->run();
		test(seen == 5, "continuation ran");
	}
	test(vow::default_scheduler() == global, "guard restores the global queue");

	{
		auto prev = vow::set_default_scheduler(b);
		test(!prev, "no scheduler was installed");
		test(vow::default_scheduler() == b, "set installs");

		prev = vow::set_default_scheduler(nullptr);
		test(prev == b, "set returns the previous scheduler");
		test(vow::default_scheduler() == global, "null reverts to global");
	}

	return 0;
}
