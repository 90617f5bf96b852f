/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "meshxfer/transfer_registry.hpp"

#include <thread>

using namespace meshxfer;

namespace {

struct counter_transfer
{
	int value = 0;
	bool done = false;
	bool releasable() const { return done; }
};

using registry = aux::transfer_registry<counter_transfer>;

}

MESHXFER_TEST(insert_replace)
{
	registry r;
	TEST_EQUAL(r.size(), 0);
	TEST_CHECK(!r.insert("a", std::make_unique<counter_transfer>()));
	TEST_CHECK(r.contains("a"));

	auto t = std::make_unique<counter_transfer>();
	t->value = 7;
	// a second insert under the same id replaces the first
	TEST_CHECK(r.insert("a", std::move(t)));
	TEST_EQUAL(r.size(), 1);
	TEST_EQUAL(r.with_transfer("a", [](counter_transfer& c) { return c.value; }).value_or(-1), 7);
}

MESHXFER_TEST(remove)
{
	registry r;
	r.insert("a", std::make_unique<counter_transfer>());
	r.insert("b", std::make_unique<counter_transfer>());
	TEST_CHECK(r.remove("a"));
	TEST_CHECK(!r.remove("a"));
	TEST_CHECK(!r.contains("a"));
	TEST_CHECK(r.ids() == std::vector<std::string>{"b"});
}

MESHXFER_TEST(with_transfer_unknown)
{
	registry r;
	TEST_CHECK(!r.with_transfer("x", [](counter_transfer& c) { return c.value; }));
	TEST_CHECK(!r.with_transfer("x", [](counter_transfer& c) { ++c.value; }));
	r.insert("x", std::make_unique<counter_transfer>());
	TEST_CHECK(r.with_transfer("x", [](counter_transfer& c) { ++c.value; }));
}

MESHXFER_TEST(release_after_closure)
{
	registry r;
	r.insert("a", std::make_unique<counter_transfer>());
	r.insert("b", std::make_unique<counter_transfer>());

	r.with_transfer("a", [](counter_transfer& c) { c.done = true; });
	TEST_CHECK(!r.contains("a"));
	TEST_EQUAL(r.size(), 1);

	r.insert("c", std::make_unique<counter_transfer>());
	int visited = 0;
	r.for_each([&](std::string const& id, counter_transfer& c)
	{
		++visited;
		if (id == "c") c.done = true;
	});
	TEST_EQUAL(visited, 2);
	TEST_CHECK(r.ids() == std::vector<std::string>{"b"});
}

MESHXFER_TEST(concurrent_updates)
{
	registry r;
	r.insert("a", std::make_unique<counter_transfer>());

	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i)
	{
		threads.emplace_back([&r]
		{
			for (int k = 0; k < 1000; ++k)
				r.with_transfer("a", [](counter_transfer& c) { ++c.value; });
		});
	}
	for (auto& t : threads) t.join();

	TEST_EQUAL(r.with_transfer("a", [](counter_transfer& c) { return c.value; }).value_or(-1)
		, 8000);
}
