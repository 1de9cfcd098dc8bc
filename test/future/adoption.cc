#include <vow/future.h>
#include <functional>
#include <memory>
#include <string>
#include "../test.h"

/* A future-like that is not a vow::future, settled by hand. */
class manual_thenable
:	public vow::thenable<int>
{
public:
	void
	chain(value_callback on_value, reason_callback on_reason) override
	{
		m_on_value = std::move(on_value);
		m_on_reason = std::move(on_reason);
	}

	void
	fire(int v)
	{
		m_on_value(v);
	}

	void
	fail(std::exception_ptr e)
	{
		m_on_reason(e);
	}

private:
	value_callback m_on_value;
	reason_callback m_on_reason;
};

const int CHAIN_LENGTH = 100000;

int
main()
{
	auto q = std::make_shared<vow::task_queue>();

	/* A adopts B, B adopts C, C fulfills later. */
	{
		open_future<int> c(q);
		vow::future<int> b(q, [&c](vow::fulfiller<int> ok, vow::rejecter) {
			ok(c.fut);
		    });
		vow::future<int> a(q, [&b](vow::fulfiller<int> ok, vow::rejecter) {
			ok(b);
		    });
		test(a.state() == vow::settle_state::pending, "a waits for c");

		(*c.ok)(5);
		test(b.state() == vow::settle_state::fulfilled && b.get() == 5,
		    "b took c's value");
		test(a.state() == vow::settle_state::fulfilled && a.get() == 5,
		    "a took c's value");
	}

	/* Adopting a settled future takes one queue hop. */
	{
		auto b = vow::future<int>(q,
		    [](vow::fulfiller<int> ok, vow::rejecter) { ok(8); });
		vow::future<int> a(q, [&b](vow::fulfiller<int> ok, vow::rejecter) {
			ok(b);
		    });
		test(a.state() == vow::settle_state::pending, "not settled yet");
		q->run();
		test(a.get() == 8, "settled after the hop");
	}

	/* A handler returning a future is unwrapped. */
	{
		open_future<int> inner(q);
		open_future<int> p(q);
		vow::future<int> r = p.fut.then(
		    [&inner](int) { return inner.fut; });

		(*p.ok)(1);
		test(r.state() == vow::settle_state::pending,
		    "waits for the returned future");
		(*inner.ok)(2);
		test(r.get() == 2, "returned future's value");
	}

	/* Long adoption chains settle without deep recursion. */
	{
		open_future<int> last(q);
		vow::future<int> head = last.fut;
		for (int i = 0; i < CHAIN_LENGTH; ++i) {
			head = vow::future<int>(q,
			    [&head](vow::fulfiller<int> ok, vow::rejecter) {
				ok(head);
			    });
		}

		int seen = 0;
		head.then([&seen](int v) { seen = v; });
		(*last.ok)(42);
		test(head.get() == 42, "value reaches the end of the chain");
		test(seen == 42, "listener on the outermost future ran");
	}

	{
		open_future<int> last(q);
		vow::future<int> head = last.fut;
		for (int i = 0; i < CHAIN_LENGTH; ++i) {
			head = vow::future<int>(q,
			    [&head](vow::fulfiller<int> ok, vow::rejecter) {
				ok(head);
			    });
		}

		(*last.fail)(std::string("deep"));
		test(describe(head.reason()) == "deep",
		    "rejection reaches the end of the chain");
	}

	/* Long reason adoption chains settle without deep recursion. */
	{
		open_future<int> last(q);
		vow::future<int> head = last.fut;
		for (int i = 0; i < CHAIN_LENGTH; ++i) {
			head = vow::future<int>(q,
			    [&head](vow::fulfiller<int>, vow::rejecter fail) {
				fail(head);
			    });
		}

		(*last.fail)(std::string("deep"));
		test(describe(head.reason()) == "deep",
		    "reason travels down a reason adoption chain");
	}

	{
		open_future<int> last(q);
		vow::future<int> head = last.fut;
		for (int i = 0; i < CHAIN_LENGTH; ++i) {
			head = vow::future<int>(q,
			    [&head](vow::fulfiller<int>, vow::rejecter fail) {
				fail(head);
			    });
		}

		(*last.ok)(7);
		test(describe(head.reason()) == "7",
		    "value becomes the reason at the end of the chain");
	}

	/* A future adopting itself is rejected. */
	{
		open_future<int> p(q);
		(*p.ok)(p.fut);

		bool cycle = false;
		try {
			p.fut.get();
		} catch (const vow::chaining_cycle&) {
			cycle = true;
		}
		test(cycle, "self adoption rejects with chaining_cycle");
	}

	/* Adoption cycles are rejected and release their states. */
	{
		auto token = std::make_shared<int>(0);
		{
			open_future<int> a(q);
			open_future<int> b(q);
			open_future<int> c(q);
			a.fut.then([token](int) {});
			(*a.ok)(b.fut);
			(*b.ok)(c.fut);
			(*c.ok)(a.fut);

			test(c.fut.state() == vow::settle_state::rejected,
			    "closing the cycle rejects");
			test(a.fut.state() == vow::settle_state::rejected &&
			    b.fut.state() == vow::settle_state::rejected,
			    "the rest of the cycle follows");

			bool cycle = false;
			try {
				a.fut.get();
			} catch (const vow::chaining_cycle&) {
				cycle = true;
			}
			test(cycle, "cycle reported as chaining_cycle");
		}
		test(token.use_count() == 1, "cycle states were released");
	}

	{
		auto token = std::make_shared<int>(0);
		{
			open_future<int> a(q);
			open_future<int> b(q);
			b.fut.then([token](int) {});
			(*a.fail)(b.fut);
			(*b.ok)(a.fut);

			test(b.fut.state() == vow::settle_state::rejected &&
			    a.fut.state() == vow::settle_state::rejected,
			    "mixed reason and value adoption cycle rejects");
		}
		test(token.use_count() == 1, "mixed cycle states were released");
	}

	/* Adoption does not lock the future. */
	{
		open_future<int> b(q);
		open_future<int> a(q);
		(*a.ok)(b.fut);
		(*a.ok)(1);
		(*b.ok)(2);
		test(a.fut.get() == 1, "direct fulfill wins over the adopted one");
	}

	/* Foreign thenables. */
	{
		auto t = std::make_shared<manual_thenable>();
		vow::future<int> a(q, [&t](vow::fulfiller<int> ok, vow::rejecter) {
			ok(t);
		    });
		test(a.state() == vow::settle_state::pending, "waits for fire");
		t->fire(7);
		test(a.get() == 7, "value from the foreign thenable");
	}

	{
		auto t = std::make_shared<manual_thenable>();
		vow::future<int> a(q, [&t](vow::fulfiller<int> ok, vow::rejecter) {
			ok(t);
		    });
		t->fail(std::make_exception_ptr(std::string("foreign")));
		test(describe(a.reason()) == "foreign",
		    "reason from the foreign thenable");
	}

	/* Reason adoption: either outcome of the adopted future rejects. */
	{
		open_future<std::string> b(q);
		open_future<int> a(q);
		(*a.fail)(b.fut);
		test(a.fut.state() == vow::settle_state::pending,
		    "reason adoption waits");
		(*b.ok)(std::string("boom"));
		test(describe(a.fut.reason()) == "boom",
		    "fulfillment value became the reason");
	}

	{
		open_future<std::string> b(q);
		open_future<int> a(q);
		(*a.fail)(b.fut);
		(*b.fail)(std::string("inner"));
		test(describe(a.fut.reason()) == "inner",
		    "inner reason became the reason");
	}

	{
		open_future<void> b(q);
		open_future<int> a(q);
		(*a.fail)(b.fut);
		(*b.ok)();

		bool empty = false;
		try {
			a.fut.get();
		} catch (const vow::empty_reason&) {
			empty = true;
		}
		test(empty, "void fulfillment rejects without a reason");
	}

	{
		auto t = std::make_shared<manual_thenable>();
		open_future<int> a(q);
		(*a.fail)(t);
		t->fire(3);
		test(describe(a.fut.reason()) == "3",
		    "foreign value became the reason");
	}

	/* Adopting a future without state. */
	{
		open_future<int> a(q);
		bool threw = false;
		try {
			(*a.ok)(vow::future<int>());
		} catch (const vow::future_error& e) {
			threw = (e.code() == vow::future_errc::no_state);
		}
		test(threw, "adopting an invalid future throws");
	}

	return 0;
}
