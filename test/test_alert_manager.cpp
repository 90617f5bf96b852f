/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/settings_pack.hpp"

#include <atomic>
#include <thread>

using namespace meshxfer;

MESHXFER_TEST(limit)
{
	alert_manager mgr(500, alert_category::all);
	TEST_EQUAL(mgr.alert_queue_size_limit(), 500);

	// try add 600 alerts to make sure we honor the limit of 500
	for (int i = 0; i < 600; ++i)
		mgr.emplace_alert<transfer_complete_alert>("node", "file");

	std::vector<alert*> alerts;
	mgr.get_all(alerts);

	// even though we posted 600, the limit was 500
	// +1 for the alerts_dropped_alert
	TEST_EQUAL(alerts.size(), 501);

	auto const* dropped = alert_cast<alerts_dropped_alert>(alerts.back());
	TEST_CHECK(dropped != nullptr);
	if (dropped != nullptr)
	{
		TEST_CHECK(dropped->dropped_alerts.test(transfer_complete_alert::alert_type));
		TEST_CHECK(!dropped->dropped_alerts.test(file_saved_alert::alert_type));
	}

	// the drop record is cleared once reported
	mgr.emplace_alert<transfer_complete_alert>("node", "file");
	mgr.get_all(alerts);
	TEST_EQUAL(alerts.size(), 1);
	TEST_CHECK(alert_cast<alerts_dropped_alert>(alerts.back()) == nullptr);
}

MESHXFER_TEST(limit_from_settings)
{
	settings_pack s;
	s.set_int(settings_pack::alert_queue_size, 3);
	alert_manager mgr(s.get_int(settings_pack::alert_queue_size), alert_category::all);

	mgr.emplace_alert<transfer_complete_alert>("node", "a");
	mgr.emplace_alert<file_saved_alert>("node", "a", std::int64_t(10), seconds(1));
	mgr.emplace_alert<transfer_complete_alert>("node", "b");
	mgr.emplace_alert<send_rate_alert>("node", milliseconds(300));
	mgr.emplace_alert<file_saved_alert>("node", "b", std::int64_t(10), seconds(1));

	std::vector<alert*> alerts;
	mgr.get_all(alerts);
	TEST_EQUAL(alerts.size(), 4);
	auto const* dropped = alert_cast<alerts_dropped_alert>(alerts.back());
	TEST_CHECK(dropped != nullptr);
	if (dropped != nullptr)
	{
		TEST_CHECK(dropped->dropped_alerts.test(send_rate_alert::alert_type));
		TEST_CHECK(dropped->dropped_alerts.test(file_saved_alert::alert_type));
		TEST_CHECK(!dropped->dropped_alerts.test(transfer_complete_alert::alert_type));
	}
}

MESHXFER_TEST(alert_mask)
{
	alert_manager mgr(100);

	TEST_CHECK(mgr.should_post<transfer_failed_alert>());
	TEST_CHECK(!mgr.should_post<transfer_log_alert>());
	TEST_CHECK(!mgr.should_post<file_saved_alert>());

	mgr.set_alert_mask(alert_category::status);
	TEST_EQUAL(mgr.alert_mask(), alert_category::status);
	TEST_CHECK(!mgr.should_post<transfer_failed_alert>());
	TEST_CHECK(mgr.should_post<file_saved_alert>());
	TEST_CHECK(mgr.should_post<transfer_complete_alert>());
}

MESHXFER_TEST(get_all_swaps_generations)
{
	alert_manager mgr(100, alert_category::all);
	mgr.emplace_alert<transfer_complete_alert>("node", "a.txt");

	std::vector<alert*> alerts;
	mgr.get_all(alerts);
	TEST_EQUAL(alerts.size(), 1);
	auto const* a = alert_cast<transfer_complete_alert>(alerts[0]);
	TEST_CHECK(a != nullptr);
	if (a != nullptr)
	{
		TEST_EQUAL(a->transfer_id, "node");
		TEST_EQUAL(a->filename, "a.txt");
		TEST_EQUAL(std::string(a->what()), "transfer_complete");
	}
	TEST_CHECK(alert_cast<file_saved_alert>(alerts[0]) == nullptr);

	mgr.get_all(alerts);
	TEST_CHECK(alerts.empty());
}

MESHXFER_TEST(wait_for_alert)
{
	alert_manager mgr(100, alert_category::all);

	time_point const start = aux::time_now();
	alert* a = mgr.wait_for_alert(milliseconds(100));
	TEST_CHECK(a == nullptr);
	TEST_CHECK(aux::time_now() - start >= milliseconds(90));

	mgr.emplace_alert<transfer_complete_alert>("node", "file");
	a = mgr.wait_for_alert(milliseconds(1000));
	TEST_CHECK(a != nullptr);
	TEST_CHECK(alert_cast<transfer_complete_alert>(a) != nullptr);

	std::vector<alert*> alerts;
	mgr.get_all(alerts);

	std::thread posting_thread([&mgr]
	{
		std::this_thread::sleep_for(milliseconds(10));
		mgr.emplace_alert<transfer_complete_alert>("node", "file");
	});
	a = mgr.wait_for_alert(seconds(5));
	TEST_CHECK(a != nullptr);
	posting_thread.join();
}

MESHXFER_TEST(alert_messages)
{
	alert_manager mgr(100, alert_category::all);
	mgr.emplace_alert<transfer_failed_alert>("node", "a.txt"
		, error_code(errors::retries_exhausted));
	mgr.emplace_alert<send_failed_alert>("node", std::int64_t(3)
		, error_code(errors::send_failed));
	mgr.emplace_alert<hash_failed_alert>("node", std::vector<std::uint32_t>{1, 2}, false);
	mgr.emplace_alert<send_rate_alert>("node", milliseconds(300));

	std::vector<alert*> alerts;
	mgr.get_all(alerts);
	TEST_EQUAL(alerts.size(), 4);
	for (auto const* a : alerts)
	{
		std::string const msg = a->message();
		TEST_CHECK(!msg.empty());
		TEST_CHECK(msg.find("node") != std::string::npos);
	}

	auto const* tf = alert_cast<transfer_failed_alert>(alerts[0]);
	TEST_CHECK(tf != nullptr);
	if (tf != nullptr) TEST_EQUAL(tf->error, error_code(errors::retries_exhausted));
	TEST_EQUAL(alerts[0]->category(), alert_category::error);
	TEST_EQUAL(alerts[3]->category(), alert_category::performance_warning);
}

MESHXFER_TEST(alert_names)
{
	TEST_EQUAL(std::string(alert_name(transfer_log_alert::alert_type)), "transfer_log");
	TEST_EQUAL(std::string(alert_name(alerts_dropped_alert::alert_type)), "alerts_dropped");
	TEST_EQUAL(std::string(alert_name(num_alert_types)), "");
}
